#include "voxgate/session.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <sys/socket.h>
}

#include <stdexcept>
#include <utility>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        static constexpr std::string_view result_key = "result"sv;

        static bool has_result(const turn_request& request) {
            return request.query.contains(result_key);
        }

    }  // namespace detail

    conversation_session::conversation_session(
            session_endpoint endpoint, session_daemon& daemon, const session_log& log, std::string origin_url)
            : endpoint_{std::move(endpoint)},
              daemon_{daemon},
              log_{log},
              origin_url_{std::move(origin_url)},
              session_url_{endpoint_.to_string()} {}

    void conversation_session::ensure_active() const {
        if (state_ == session_state::completed) {
            throw std::logic_error("conversation already ended");
        }
        if (state_ == session_state::abandoned) {
            throw std::logic_error("conversation was abandoned by the caller");
        }
    }

    void conversation_session::begin() {
        ensure_active();
        if (connection_) {
            return;
        }

        for (;;) {
            auto conn = daemon_.wait_for_connection();
            if (!conn) {
                state_ = session_state::abandoned;
                throw conversation_abandoned("caller never followed the redirect");
            }
            // the redirect request carries nothing we need
            if (http::read_request(conn->get(), daemon_.idle_timeout())) {
                connection_ = std::move(*conn);
                state_ = session_state::rendering_response;
                return;
            }
            log_.write("Connection went away without getting anything from it."sv);
        }
    }

    void conversation_session::ensure_connection() {
        if (!connection_) {
            begin();
        }
    }

    std::vector<std::string> conversation_session::take_pending() {
        return std::exchange(pending_, {});
    }

    void conversation_session::append_output(const audio_options& audio) {
        ensure_active();
        validate(audio);
        pending_.push_back(markup::render_audio(audio, origin_url_));
        log_.write("Saying {}"_format(pending_.back()));
    }

    void conversation_session::append_pause(int milliseconds) {
        ensure_active();
        validate_pause(milliseconds);
        pending_.push_back(markup::render_pause(milliseconds));
        log_.write("Pausing for {} milliseconds"_format(milliseconds));
    }

    void conversation_session::send_document(std::string_view document) {
        last_document_ = std::string(document);
        if (!http::write_all(connection_->get(), http::make_response(200, document))) {
            log_.write("Caller went away before the response was sent"sv);
        }
        ::shutdown(connection_->get(), SHUT_WR);
        connection_.reset();
        log_.write("Closing connection"sv);
    }

    turn_request conversation_session::await_reply(const reply_check& accept) {
        state_ = session_state::awaiting_turn;

        for (;;) {
            log_.write("Waiting for new connection"sv);
            auto conn = daemon_.wait_for_connection();
            if (!conn) {
                state_ = session_state::abandoned;
                throw conversation_abandoned("no reply within {}s"_format(daemon_.idle_timeout().count()));
            }

            auto request = http::read_request(conn->get(), daemon_.idle_timeout());
            if (!request) {
                log_.write("Connection went away without getting anything from it."sv);
                continue;
            }

            if (accept(*request)) {
                connection_ = std::move(*conn);
                ++completed_turns_;
                state_ = session_state::rendering_response;
                return std::move(*request);
            }

            ++rejected_requests_;
            log_.write("Invalid request <{}> {} {}"_format(request->raw_query, request->method, request->target));
            (void)http::write_all(conn->get(), http::make_error_response(403));
        }
    }

    std::string conversation_session::collect_input(const listen_options& opts) {
        ensure_active();
        validate(opts);
        ensure_connection();

        send_document(markup::render_listen(take_pending(), opts, session_url_, origin_url_));

        auto request = await_reply([](const turn_request& r) { return r.method == "GET"sv && detail::has_result(r); });
        auto result = request.query.find(detail::result_key)->second;
        log_.write("Got string {}"_format(result));
        return result;
    }

    recording_result conversation_session::record(const record_options& opts) {
        ensure_active();
        validate(opts);
        ensure_connection();

        send_document(markup::render_record(take_pending(), opts, session_url_, origin_url_));

        auto request = await_reply(detail::has_result);
        auto disposition = request.query.find(detail::result_key)->second;
        log_.write("Got result code {}"_format(disposition));

        if (disposition.empty() || disposition == "0"sv) {
            return {};
        }
        if (disposition == opts.null_audio_word) {
            return recording_result{.disposition = std::move(disposition)};
        }

        auto payload = parse_recording_payload(request.body.value_or(std::string{}));
        log_.write("Found audio boundary line: {}"_format(payload.boundary));
        if (!payload.boundary_closed) {
            log_.write("Recording payload ended without a closing boundary"sv);
        }
        if (payload.discarded_lines > 0U) {
            log_.write("Ignoring {} trailing audio data lines"_format(payload.discarded_lines));
        }
        return recording_result{.audio = std::move(payload.audio), .disposition = std::move(disposition)};
    }

    void conversation_session::end_conversation(const end_directive& directive) {
        ensure_active();
        ensure_connection();

        std::string document{};
        if (const auto* target = std::get_if<goto_target>(&directive)) {
            auto url = http::make_absolute_url(origin_url_, target->url);
            log_.write("Going to {}"_format(url));
            document = markup::render_goto(take_pending(), url);
        }
        else {
            log_.write("Disconnecting"sv);
            document = markup::render_disconnect(take_pending());
        }

        send_document(document);
        state_ = session_state::completed;
    }

}  // namespace voxgate

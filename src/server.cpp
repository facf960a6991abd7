#include "voxgate/server.hpp"

#include "line_editor.hpp"

#include "voxgate/daemon.hpp"
#include "voxgate/endpoint.hpp"
#include "voxgate/format.hpp"
#include "voxgate/handoff.hpp"
#include "voxgate/markup.hpp"
#include "voxgate/port_allocator.hpp"
#include "voxgate/proxy.hpp"
#include "voxgate/session.hpp"
#include "voxgate/supervisor.hpp"
#include "voxgate/terminal.hpp"

#include <iterator>
#include <stdexcept>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        static std::optional<std::string> read_cgi_body(std::istream& in, const cgi_environment& env) {
            if (env.content_length) {
                std::string body(*env.content_length, '\0');
                in.read(body.data(), static_cast<std::streamsize>(body.size()));
                body.resize(static_cast<std::size_t>(in.gcount()));
                return body;
            }
            std::string body{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
            return body;
        }

        static void write_cgi(std::ostream& out, std::string_view document) {
            out << proxy::render_cgi_document(document);
            out.flush();
        }

        // Runs the script against an already published endpoint; returns the exit status.
        static int serve_conversation(
                conversation_session& session, const conversation_script& script, const session_log& log) {
            try {
                session.begin();
                script(session);
                if (session.state() != session_state::completed) {
                    session.end_conversation(hangup{});
                }
            } catch (const conversation_abandoned& e) {
                log.write("Caller hung up: {}"_format(e.what()));
            }
            log.write("Conversation over after {} turns"_format(session.completed_turns()));
            return 0;
        }

    }  // namespace detail

    voice_server::voice_server(bridge_config cfg, cgi_environment env)
            : cfg_{std::move(cfg)}, env_{std::move(env)}, log_{cfg_} {
        validate(cfg_);
    }

    int voice_server::run(const conversation_script& script, std::ostream& out, std::istream& in) {
        auto mode = env_.mode();
        log_.write("Invoked in {} mode"_format(mode));
        switch (mode) {
            case invocation_mode::proxy:
                return run_proxy(out, in);
            case invocation_mode::terminal:
                return run_terminal(script, out);
            case invocation_mode::markup:
                return run_markup(script, out);
        }
        return 1;
    }

    int voice_server::run_proxy(std::ostream& out, std::istream& in) {
        auto request = parse_proxy_request(env_.query_string.value_or(std::string{}));
        if (!request) {
            throw std::logic_error("proxy mode without a proxy request");
        }

        proxy::relay_options opts{};
        opts.inbound_method = env_.request_method.value_or(std::string{"GET"});
        opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.relay_timeout);
        if (env_.content_type) {
            opts.content_type = *env_.content_type;
        }
        if (proxy::relays_as_post(*request, opts.inbound_method)) {
            opts.body = detail::read_cgi_body(in, env_);
        }

        log_.write("Relaying {} to localhost:{}"_format(opts.body ? "POST"sv : "GET"sv, request->target_port));
        auto document = proxy::relay(*request, opts);
        detail::write_cgi(out, document);
        return 0;
    }

    int voice_server::run_terminal(const conversation_script& script, std::ostream& out) {
        line_editor editor{};
        terminal_conversation session{out, [&editor](std::string_view prompt) { return editor.read_line(prompt); }};
        try {
            script(session);
        } catch (const conversation_abandoned& e) {
            log_.write("Terminal session ended: {}"_format(e.what()));
        }
        return 0;
    }

    int voice_server::run_markup(const conversation_script& script, std::ostream& out) {
        auto origin_url = env_.front_end_url(cfg_);
        auto front_end_host = env_.front_end_host(cfg_);
        if (!origin_url || !front_end_host) {
            throw std::logic_error("markup mode needs SERVER_NAME and SCRIPT_NAME");
        }

        handoff_channel channel{};
        posix_detach_platform platform{log_};
        process_supervisor supervisor{platform, channel, log_};

        process_role role{};
        try {
            role = supervisor.detach();
        } catch (const std::exception& e) {
            log_.write("Detach failed: {}"_format(e.what()));
            throw;
        }

        if (role == process_role::invoker) {
            auto url = channel.await(std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.handoff_timeout));
            if (!url) {
                log_.write("Worker never published a session URL"sv);
                throw std::runtime_error(
                        "worker did not publish a session URL within {}s"_format(cfg_.handoff_timeout.count()));
            }
            detail::write_cgi(out, markup::render_redirect(*url));
            return 0;
        }

        port_allocation allocation{};
        try {
            allocation = allocate_port(cfg_.min_port, cfg_.max_port);
        } catch (const std::exception& e) {
            log_.write("Port allocation failed: {}"_format(e.what()));
            channel.abandon();
            return 1;
        }

        if (allocation.used_fallback) {
            log_.write("Couldn't find an unused port between {} and {}"_format(cfg_.min_port, cfg_.max_port));
        }

        auto proxied = cfg_.avoid_firewall || allocation.used_fallback;
        auto endpoint = proxied ? make_proxied_endpoint(*front_end_host, *env_.script_name, allocation.port)
                                : make_direct_endpoint(cfg_.advertise_host.value_or(local_host_name()), allocation.port);

        try {
            channel.publish(endpoint.to_string());
        } catch (const std::exception& e) {
            log_.write("Couldn't hand the session URL back: {}"_format(e.what()));
            return 1;
        }

        session_daemon daemon{std::move(allocation), cfg_.idle_timeout, log_};
        log_.write("Server ready on port {}; url is {} ({})"_format(daemon.port(), endpoint, endpoint.mode));

        conversation_session session{std::move(endpoint), daemon, log_, std::move(*origin_url)};
        return detail::serve_conversation(session, script, log_);
    }

}  // namespace voxgate

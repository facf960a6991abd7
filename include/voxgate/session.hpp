#pragma once

#include "conversation.hpp"
#include "daemon.hpp"
#include "endpoint.hpp"
#include "http.hpp"
#include "log.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voxgate {

    // One conversation spread over many short HTTP connections. Output accumulates until
    // a turn flushes it into the response on the held connection; the reply then arrives
    // on the next connection the daemon accepts.
    class conversation_session final : public conversation {
      public:
        conversation_session(
                session_endpoint endpoint, session_daemon& daemon, const session_log& log, std::string origin_url);

        // Waits for the caller to follow the redirect. That first request carries nothing
        // but its connection receives the first turn.
        void begin();

        void append_output(const audio_options& audio) override;
        void append_pause(int milliseconds) override;

        std::string collect_input(const listen_options& opts) override;
        recording_result record(const record_options& opts) override;

        void end_conversation(const end_directive& directive) override;

        session_state state() const { return state_; }
        std::size_t completed_turns() const { return completed_turns_; }
        std::size_t rejected_requests() const { return rejected_requests_; }
        const std::vector<std::string>& pending_output() const { return pending_; }
        const session_endpoint& endpoint() const { return endpoint_; }

        // Body of the most recent document sent to the caller.
        const std::string& last_document() const { return last_document_; }

        // Hands back and clears the queued fragments.
        std::vector<std::string> take_pending();

      private:
        using reply_check = std::function<bool(const turn_request&)>;

        void ensure_active() const;
        void ensure_connection();
        void send_document(std::string_view document);
        turn_request await_reply(const reply_check& accept);

        session_endpoint endpoint_;
        session_daemon& daemon_;
        const session_log& log_;
        std::string origin_url_;
        std::string session_url_;

        std::vector<std::string> pending_{};
        std::optional<unique_fd> connection_{};
        session_state state_{session_state::awaiting_turn};
        std::size_t completed_turns_{};
        std::size_t rejected_requests_{};
        std::string last_document_{};
    };

}  // namespace voxgate

#pragma once

#include "markup.hpp"
#include "recording.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace voxgate {

    using namespace std::string_view_literals;

    enum class session_state : uint8_t {
        awaiting_turn,
        rendering_response,
        completed,
        abandoned,
    };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::awaiting_turn:
                return "awaiting_turn"sv;
            case session_state::rendering_response:
                return "rendering_response"sv;
            case session_state::completed:
                return "completed"sv;
            case session_state::abandoned:
                return "abandoned"sv;
        }
        return "awaiting_turn"sv;
    }

    struct goto_target {
        std::string url{};
    };

    struct hangup {};

    using end_directive = std::variant<goto_target, hangup>;

    // The caller stopped answering (idle timeout, or end of input on a terminal).
    class conversation_abandoned : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Turn-building API seen by a conversation script. Option validation happens before
    // any I/O and reports std::invalid_argument; once the conversation has ended every
    // call reports std::logic_error.
    class conversation {
      public:
        virtual ~conversation() = default;

        virtual void append_output(const audio_options& audio) = 0;
        virtual void append_pause(int milliseconds) = 0;

        virtual std::string collect_input(const listen_options& opts) = 0;
        virtual recording_result record(const record_options& opts) = 0;

        virtual void end_conversation(const end_directive& directive) = 0;

        void say(std::string text) { append_output(speech(std::move(text))); }
    };

}  // namespace voxgate

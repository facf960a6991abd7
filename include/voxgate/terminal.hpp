#pragma once

#include "conversation.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace voxgate {

    // Plays a conversation on a terminal, for debugging a script without a voice platform.
    // Speech is printed, pauses are skipped and every reply is one input line.
    class terminal_conversation final : public conversation {
      public:
        using line_reader = std::function<std::optional<std::string>(std::string_view prompt)>;

        static constexpr std::string_view placeholder_audio = "insertsoundhere"sv;

        terminal_conversation(std::ostream& out, line_reader reader);

        void append_output(const audio_options& audio) override;
        void append_pause(int milliseconds) override;

        std::string collect_input(const listen_options& opts) override;
        recording_result record(const record_options& opts) override;

        void end_conversation(const end_directive& directive) override;

        bool ended() const { return ended_; }

      private:
        void ensure_active() const;
        std::string next_line();

        std::ostream& out_;
        line_reader reader_;
        bool ended_{false};
    };

}  // namespace voxgate

#include "voxgate/terminal.hpp"

#include <stdexcept>

namespace voxgate {

    terminal_conversation::terminal_conversation(std::ostream& out, line_reader reader)
            : out_{out}, reader_{std::move(reader)} {}

    void terminal_conversation::ensure_active() const {
        if (ended_) {
            throw std::logic_error("conversation already ended");
        }
    }

    std::string terminal_conversation::next_line() {
        out_.flush();
        auto line = reader_(""sv);
        if (!line) {
            ended_ = true;
            throw conversation_abandoned("end of input");
        }
        while (!line->empty() && (line->back() == '\n' || line->back() == '\r')) {
            line->pop_back();
        }
        return std::move(*line);
    }

    void terminal_conversation::append_output(const audio_options& audio) {
        ensure_active();
        validate(audio);
        const auto& text = audio.tts ? audio.tts : (audio.wav ? audio.wav : audio.data);
        out_ << *text << '\n';
    }

    void terminal_conversation::append_pause(int milliseconds) {
        ensure_active();
        validate_pause(milliseconds);
    }

    std::string terminal_conversation::collect_input(const listen_options& opts) {
        ensure_active();
        validate(opts);
        return next_line();
    }

    recording_result terminal_conversation::record(const record_options& opts) {
        ensure_active();
        validate(opts);
        auto disposition = next_line();
        return recording_result{.audio = std::string(placeholder_audio), .disposition = std::move(disposition)};
    }

    void terminal_conversation::end_conversation(const end_directive& directive) {
        ensure_active();
        if (const auto* target = std::get_if<goto_target>(&directive)) {
            out_ << "Going to " << target->url << '\n';
        }
        else {
            out_ << "Disconnecting\n";
        }
        out_.flush();
        ended_ = true;
    }

}  // namespace voxgate

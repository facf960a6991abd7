#include "line_editor.hpp"

extern "C" {
#include <isocline.h>
}

namespace voxgate {

    line_editor::line_editor() {
        ic_enable_multiline(false);
        ic_enable_history_duplicates(false);
        ic_enable_hint(false);
        ic_set_prompt_marker("", "");
        ic_set_history(nullptr, 200);
    }

    std::optional<std::string> line_editor::read_line(std::string_view prompt) {
        auto prompt_text = std::string(prompt);
        auto* raw = ic_readline(prompt_text.c_str());
        if (raw == nullptr) {
            return std::nullopt;
        }

        std::string line{raw};
        ic_free(raw);
        if (!line.empty()) {
            ic_history_add(line.c_str());
        }
        return line;
    }

}  // namespace voxgate

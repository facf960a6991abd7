#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    // isocline-backed reader for terminal conversations; history stays in memory.
    class line_editor {
      public:
        line_editor();

        line_editor(const line_editor&) = delete;
        line_editor& operator=(const line_editor&) = delete;

        std::optional<std::string> read_line(std::string_view prompt);
    };

}  // namespace voxgate

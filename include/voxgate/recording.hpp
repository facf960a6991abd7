#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    struct recording_payload {
        std::string boundary{};
        std::string audio{};
        std::size_t skipped_header_lines{};
        std::size_t discarded_lines{};
        bool boundary_closed{false};
    };

    // Outcome of a recording turn. Both empty: the caller aborted. Disposition only: the
    // null-audio word was chosen. Both set: captured audio plus the caller's disposition.
    struct recording_result {
        std::optional<std::string> audio{};
        std::optional<std::string> disposition{};
    };

    // Best-effort multipart scan: the first line is the boundary marker, header lines are
    // skipped up to the first blank line, then lines accumulate (each re-terminated with
    // '\n') until a line starting with the boundary. Anything after is discarded. Missing
    // framing yields whatever could be collected rather than an error.
    recording_payload parse_recording_payload(std::string_view body);

}  // namespace voxgate

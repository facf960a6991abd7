#include "voxgate/recording.hpp"

#include "voxgate/utils.hpp"

namespace voxgate {

    namespace detail {

        struct line_cursor {
            std::string_view rest{};

            bool done() const { return rest.empty(); }

            std::string_view next() {
                auto end = rest.find('\n');
                auto line = rest.substr(0, end);
                rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 1U);
                return line;
            }
        };

    }  // namespace detail

    recording_payload parse_recording_payload(std::string_view body) {
        recording_payload payload{};
        detail::line_cursor cursor{.rest = body};
        if (cursor.done()) {
            return payload;
        }

        payload.boundary = std::string(utils::trim_right_view(cursor.next()));

        while (!cursor.done()) {
            auto line = cursor.next();
            if (utils::trim_view(line).empty()) {
                break;
            }
            ++payload.skipped_header_lines;
        }

        while (!cursor.done()) {
            auto line = cursor.next();
            if (!payload.boundary.empty() && line.starts_with(payload.boundary)) {
                payload.boundary_closed = true;
                break;
            }
            payload.audio.append(line);
            payload.audio.push_back('\n');
        }

        while (!cursor.done()) {
            (void)cursor.next();
            ++payload.discarded_lines;
        }

        return payload;
    }

}  // namespace voxgate

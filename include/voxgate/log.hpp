#pragma once

#include "config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace voxgate {

    // Per-process diagnostic log. Each entry is appended as "HH:MM:SS message" to
    // <debug_dir>/<program_name>.log.<pid>, reopening the file per entry so that a
    // forked worker writes under its own pid.
    class session_log {
      public:
        session_log() = default;
        explicit session_log(const bridge_config& cfg);

        bool enabled() const { return enabled_; }

        void write(std::string_view message) const;

        std::filesystem::path log_path() const;
        std::filesystem::path stderr_path() const;

      private:
        std::filesystem::path path_for(std::string_view kind) const;

        bool enabled_{false};
        std::filesystem::path debug_dir_{};
        std::string program_name_{};
    };

}  // namespace voxgate

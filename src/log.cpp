#include "voxgate/log.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <unistd.h>
}

#include <ctime>
#include <fstream>
#include <iomanip>

using namespace voxgate::literals;

namespace voxgate {

    session_log::session_log(const bridge_config& cfg)
            : enabled_{cfg.debug}, debug_dir_{cfg.debug_dir}, program_name_{cfg.program_name} {}

    std::filesystem::path session_log::path_for(std::string_view kind) const {
        return debug_dir_ / "{}.{}.{}"_format(program_name_, kind, static_cast<long>(::getpid()));
    }

    std::filesystem::path session_log::log_path() const {
        return path_for("log"sv);
    }

    std::filesystem::path session_log::stderr_path() const {
        return path_for("stderr"sv);
    }

    void session_log::write(std::string_view message) const {
        if (!enabled_) {
            return;
        }

        auto now = std::time(nullptr);
        std::tm local_tm{};
        localtime_r(&now, &local_tm);

        // an unwritable log directory only loses diagnostics
        std::ofstream out{log_path(), std::ios::app};
        if (!out) {
            return;
        }
        out << std::put_time(&local_tm, "%H:%M:%S") << ' ' << message << '\n';
    }

}  // namespace voxgate

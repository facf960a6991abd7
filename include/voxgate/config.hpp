#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    using namespace std::string_view_literals;

    /*
     * voxgate Bridge Config Options
     *
     * Port allocation
     * - min_port: Smallest port the worker tries to listen on.
     * - max_port: Largest port in the preferred range. Past it the scan keeps going upward,
     *   but the session switches to proxied mode.
     * - avoid_firewall: Always relay turns through the front-end URL (proxied mode), even
     *   when a port in range was free.
     *
     * Timing
     * - idle_timeout: How long a listen waits for the caller's next request before deciding
     *   they hung up.
     * - handoff_timeout: Upper bound on the invoker's wait for the worker's session URL.
     * - relay_timeout: Upper bound on one proxy hop to the local worker.
     * All three must be positive and at most `max_timeout`.
     *
     * Addressing
     * - server_name: Overrides the CGI SERVER_NAME when building the front-end URL.
     * - advertise_host: Host placed in direct session URLs (defaults to the machine name).
     *
     * Diagnostics
     * - debug: Write <debug_dir>/<program_name>.log.<pid> and keep the worker's stderr in
     *   <debug_dir>/<program_name>.stderr.<pid>.
     * - debug_dir / program_name: Location and stem of those files.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class endpoint_mode : uint8_t { direct, proxied };
    enum class invocation_mode : uint8_t { proxy, markup, terminal };

    inline constexpr std::string_view to_string(endpoint_mode mode) {
        switch (mode) {
            case endpoint_mode::direct:
                return "direct"sv;
            case endpoint_mode::proxied:
                return "proxied"sv;
        }
        return "direct"sv;
    }

    inline constexpr bool try_parse_endpoint_mode(std::string_view text, endpoint_mode& out) {
        if (utils::str_case_eq(text, "direct"sv)) {
            out = endpoint_mode::direct;
            return true;
        }
        if (utils::str_case_eq(text, "proxied"sv) || utils::str_case_eq(text, "proxy"sv)) {
            out = endpoint_mode::proxied;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(invocation_mode mode) {
        switch (mode) {
            case invocation_mode::proxy:
                return "proxy"sv;
            case invocation_mode::markup:
                return "markup"sv;
            case invocation_mode::terminal:
                return "terminal"sv;
        }
        return "terminal"sv;
    }

    // Longest accepted timeout; every wait must stay expressible as poll()'s int milliseconds.
    inline constexpr std::chrono::seconds max_timeout{std::chrono::days{24}};

    struct bridge_config {
        uint16_t min_port{7500};
        uint16_t max_port{7550};
        bool avoid_firewall{false};

        std::chrono::seconds idle_timeout{60};
        std::chrono::seconds handoff_timeout{30};
        std::chrono::seconds relay_timeout{120};

        std::optional<std::string> server_name{};
        std::optional<std::string> advertise_host{};

        bool debug{false};
        std::filesystem::path debug_dir{"/tmp"};
        std::string program_name{"voxgate"};

        bool print_config{false};
    };

    // Throws std::invalid_argument on an unusable combination.
    void validate(const bridge_config& cfg);

    // Applies a persisted JSON config file on top of `cfg`; throws std::runtime_error.
    void load_config_file(const std::filesystem::path& path, bridge_config& cfg);

    void print_config(const bridge_config& cfg, std::ostream& os);

}  // namespace voxgate

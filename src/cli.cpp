#include "voxgate/cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace voxgate::cli {

    namespace detail {

        static std::optional<std::string> normalize_optional(const std::string& value) {
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, bridge_config& cfg) {
        CLI::App app{"voxgate"};

        bool show_version = false;
        std::string config_arg{};
        uint16_t min_port_arg{cfg.min_port};
        uint16_t max_port_arg{cfg.max_port};
        int64_t timeout_arg{cfg.idle_timeout.count()};
        int64_t handoff_timeout_arg{cfg.handoff_timeout.count()};
        int64_t relay_timeout_arg{cfg.relay_timeout.count()};
        std::string debug_dir_arg{cfg.debug_dir.string()};
        std::string server_name_arg{};
        std::string advertise_host_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file applied before command-line overrides");
        auto* min_port_opt = app.add_option("--min-port", min_port_arg, "Lowest port tried for a session");
        auto* max_port_opt = app.add_option("--max-port", max_port_arg, "Highest port of the preferred range");
        auto* avoid_opt = app.add_flag("--avoid-firewall", "Relay every turn through the front-end URL");
        auto* timeout_opt = app.add_option("--timeout", timeout_arg, "Seconds to wait for the caller's next turn");
        auto* handoff_opt =
                app.add_option("--handoff-timeout", handoff_timeout_arg, "Seconds the invoker waits for the worker");
        auto* relay_opt = app.add_option("--relay-timeout", relay_timeout_arg, "Seconds one proxy hop may take");
        auto* debug_opt = app.add_flag("--debug", "Write a session log and keep the worker's stderr");
        auto* debug_dir_opt = app.add_option("--debug-dir", debug_dir_arg, "Directory for log and stderr files");
        auto* server_name_opt =
                app.add_option("--server-name", server_name_arg, "Front-end host overriding SERVER_NAME");
        auto* advertise_opt =
                app.add_option("--advertise-host", advertise_host_arg, "Host placed in direct session URLs");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "voxgate " VOXGATE_VERSION "\n";
            return std::optional<int>{0};
        }

        if (!config_arg.empty()) {
            try {
                load_config_file(config_arg, cfg);
            } catch (const std::exception& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (min_port_opt->count() > 0U) {
            cfg.min_port = min_port_arg;
        }
        if (max_port_opt->count() > 0U) {
            cfg.max_port = max_port_arg;
        }
        if (avoid_opt->count() > 0U) {
            cfg.avoid_firewall = true;
        }
        if (timeout_opt->count() > 0U) {
            cfg.idle_timeout = std::chrono::seconds{timeout_arg};
        }
        if (handoff_opt->count() > 0U) {
            cfg.handoff_timeout = std::chrono::seconds{handoff_timeout_arg};
        }
        if (relay_opt->count() > 0U) {
            cfg.relay_timeout = std::chrono::seconds{relay_timeout_arg};
        }
        if (debug_opt->count() > 0U) {
            cfg.debug = true;
        }
        if (debug_dir_opt->count() > 0U) {
            cfg.debug_dir = debug_dir_arg;
        }
        if (server_name_opt->count() > 0U) {
            cfg.server_name = detail::normalize_optional(server_name_arg);
        }
        if (advertise_opt->count() > 0U) {
            cfg.advertise_host = detail::normalize_optional(advertise_host_arg);
        }

        try {
            validate(cfg);
        } catch (const std::invalid_argument& e) {
            std::cerr << "invalid configuration: " << e.what() << '\n';
            return std::optional<int>{2};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace voxgate::cli

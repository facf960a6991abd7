#include "voxgate/config.hpp"

#include "voxgate/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        namespace fs = std::filesystem;

        struct persisted_config {
            int schema_version{1};
            std::optional<uint16_t> min_port{};
            std::optional<uint16_t> max_port{};
            std::optional<bool> avoid_firewall{};
            std::optional<int64_t> idle_timeout_s{};
            std::optional<int64_t> handoff_timeout_s{};
            std::optional<int64_t> relay_timeout_s{};
            std::optional<std::string> server_name{};
            std::optional<std::string> advertise_host{};
            std::optional<bool> debug{};
            std::optional<std::string> debug_dir{};
        };

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static void validate_timeout(std::string_view name, std::chrono::seconds value) {
            if (value.count() <= 0) {
                throw std::invalid_argument("{} must be positive"_format(name));
            }
            if (value > max_timeout) {
                throw std::invalid_argument(
                        "{} of {}s exceeds the {}s limit"_format(name, value.count(), max_timeout.count()));
            }
        }

    }  // namespace detail

    void validate(const bridge_config& cfg) {
        if (cfg.min_port == 0U) {
            throw std::invalid_argument("min_port must be positive");
        }
        if (cfg.min_port > cfg.max_port) {
            throw std::invalid_argument("min_port {} exceeds max_port {}"_format(cfg.min_port, cfg.max_port));
        }
        detail::validate_timeout("idle_timeout", cfg.idle_timeout);
        detail::validate_timeout("handoff_timeout", cfg.handoff_timeout);
        detail::validate_timeout("relay_timeout", cfg.relay_timeout);
    }

    void load_config_file(const std::filesystem::path& path, bridge_config& cfg) {
        detail::persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read_json(data, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
        detail::validate_supported_schema_version(data.schema_version, path);

        if (data.min_port) {
            cfg.min_port = *data.min_port;
        }
        if (data.max_port) {
            cfg.max_port = *data.max_port;
        }
        if (data.avoid_firewall) {
            cfg.avoid_firewall = *data.avoid_firewall;
        }
        if (data.idle_timeout_s) {
            cfg.idle_timeout = std::chrono::seconds{*data.idle_timeout_s};
        }
        if (data.handoff_timeout_s) {
            cfg.handoff_timeout = std::chrono::seconds{*data.handoff_timeout_s};
        }
        if (data.relay_timeout_s) {
            cfg.relay_timeout = std::chrono::seconds{*data.relay_timeout_s};
        }
        if (data.server_name) {
            cfg.server_name = data.server_name;
        }
        if (data.advertise_host) {
            cfg.advertise_host = data.advertise_host;
        }
        if (data.debug) {
            cfg.debug = *data.debug;
        }
        if (data.debug_dir) {
            cfg.debug_dir = *data.debug_dir;
        }
    }

    void print_config(const bridge_config& cfg, std::ostream& os) {
        os << "min_port=" << cfg.min_port << '\n';
        os << "max_port=" << cfg.max_port << '\n';
        os << "avoid_firewall=" << (cfg.avoid_firewall ? "true" : "false") << '\n';
        os << "idle_timeout=" << cfg.idle_timeout.count() << "s\n";
        os << "handoff_timeout=" << cfg.handoff_timeout.count() << "s\n";
        os << "relay_timeout=" << cfg.relay_timeout.count() << "s\n";
        os << "server_name=" << (cfg.server_name ? *cfg.server_name : "<cgi>") << '\n';
        os << "advertise_host=" << (cfg.advertise_host ? *cfg.advertise_host : "<hostname>") << '\n';
        os << "debug=" << (cfg.debug ? "true" : "false") << '\n';
        os << "debug_dir=" << cfg.debug_dir.string() << '\n';
    }

}  // namespace voxgate

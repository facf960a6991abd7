#include "voxgate/cgi.hpp"

#include "voxgate/format.hpp"

#include <cstdlib>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        static constexpr auto proxy_marker = "proxyfor="sv;

        static std::optional<std::string> env_value(const char* name) {
            const auto* value = std::getenv(name);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return std::string{value};
        }

    }  // namespace detail

    cgi_environment cgi_environment::from_process() {
        cgi_environment env{};
        env.query_string = detail::env_value("QUERY_STRING");
        env.server_name = detail::env_value("SERVER_NAME");
        env.script_name = detail::env_value("SCRIPT_NAME");
        env.request_method = detail::env_value("REQUEST_METHOD");
        if (auto length = detail::env_value("CONTENT_LENGTH")) {
            env.content_length = utils::parse_integer<std::size_t>(*length);
        }
        env.content_type = detail::env_value("CONTENT_TYPE");
        return env;
    }

    invocation_mode cgi_environment::mode() const {
        if (query_string && parse_proxy_request(*query_string)) {
            return invocation_mode::proxy;
        }
        if (server_name && script_name) {
            return invocation_mode::markup;
        }
        return invocation_mode::terminal;
    }

    std::optional<std::string> cgi_environment::front_end_host(const bridge_config& cfg) const {
        if (cfg.server_name) {
            return cfg.server_name;
        }
        return server_name;
    }

    std::optional<std::string> cgi_environment::front_end_url(const bridge_config& cfg) const {
        auto host = front_end_host(cfg);
        if (!host || !script_name) {
            return std::nullopt;
        }
        return "http://{}{}"_format(*host, *script_name);
    }

    std::optional<proxy_request> parse_proxy_request(std::string_view query) {
        auto pos = query.find(detail::proxy_marker);
        while (pos != std::string_view::npos) {
            auto digits_start = pos + detail::proxy_marker.size();
            auto amp = query.find('&', digits_start);
            // the marker must begin a parameter
            auto at_boundary = pos == 0U || query[pos - 1U] == '&';
            if (at_boundary && amp != std::string_view::npos) {
                if (auto port = utils::parse_integer<uint16_t>(query.substr(digits_start, amp - digits_start));
                    port && *port > 0U) {
                    return proxy_request{.target_port = *port, .remainder = std::string(query.substr(amp + 1U))};
                }
            }
            pos = query.find(detail::proxy_marker, pos + 1U);
        }
        return std::nullopt;
    }

}  // namespace voxgate

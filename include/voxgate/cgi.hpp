#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    // The slice of the CGI environment the bridge looks at.
    struct cgi_environment {
        std::optional<std::string> query_string{};
        std::optional<std::string> server_name{};
        std::optional<std::string> script_name{};
        std::optional<std::string> request_method{};
        std::optional<std::size_t> content_length{};
        std::optional<std::string> content_type{};

        static cgi_environment from_process();

        invocation_mode mode() const;

        // "http://<server><script>", with `cfg.server_name` taking precedence.
        std::optional<std::string> front_end_url(const bridge_config& cfg) const;
        std::optional<std::string> front_end_host(const bridge_config& cfg) const;
    };

    // Relay instruction carried by a front-end request: "proxyfor=<port>&<remainder>".
    struct proxy_request {
        uint16_t target_port{};
        std::string remainder{};
    };

    std::optional<proxy_request> parse_proxy_request(std::string_view query);

}  // namespace voxgate

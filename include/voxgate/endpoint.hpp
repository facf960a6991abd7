#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>

namespace voxgate {

    // Where the caller reaches the worker. Direct: the worker's own listener. Proxied:
    // the front-end script, which relays to `port` on localhost.
    struct session_endpoint {
        static constexpr bool to_string_formattable = true;

        std::string host{};
        uint16_t port{};
        std::string base_path{"/"};
        endpoint_mode mode{endpoint_mode::direct};

        // Always ends in '?' or '&' so a query parameter can be appended directly.
        std::string to_string() const;
    };

    session_endpoint make_direct_endpoint(std::string host, uint16_t port);
    session_endpoint make_proxied_endpoint(std::string front_end_host, std::string script_path, uint16_t port);

    // Machine host name, "localhost" when it cannot be determined.
    std::string local_host_name();

}  // namespace voxgate

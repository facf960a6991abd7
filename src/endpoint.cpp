#include "voxgate/endpoint.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <unistd.h>
}

using namespace voxgate::literals;

namespace voxgate {

    std::string session_endpoint::to_string() const {
        switch (mode) {
            case endpoint_mode::direct:
                return "http://{}:{}{}?"_format(host, port, base_path);
            case endpoint_mode::proxied:
                return "http://{}{}?proxyfor={}&"_format(host, base_path, port);
        }
        return {};
    }

    session_endpoint make_direct_endpoint(std::string host, uint16_t port) {
        return session_endpoint{.host = std::move(host), .port = port, .base_path = "/", .mode = endpoint_mode::direct};
    }

    session_endpoint make_proxied_endpoint(std::string front_end_host, std::string script_path, uint16_t port) {
        return session_endpoint{
                .host = std::move(front_end_host),
                .port = port,
                .base_path = std::move(script_path),
                .mode = endpoint_mode::proxied};
    }

    std::string local_host_name() {
        char name[256]{};
        if (::gethostname(name, sizeof(name) - 1U) != 0 || name[0] == '\0') {
            return "localhost";
        }
        return std::string{name};
    }

}  // namespace voxgate

#pragma once

#include "http.hpp"

#include <cstdint>

namespace voxgate {

    struct port_allocation {
        unique_fd socket{};
        uint16_t port{};
        bool used_fallback{false};
    };

    // Scans [min_port, max_port] upward and keeps the first socket that binds and listens.
    // When the whole range is taken the scan continues past max_port and the result is
    // flagged `used_fallback` so the caller can switch to proxied mode. Contention on a
    // single port is expected; only running out of ports altogether, or a failure that is
    // not contention, throws std::system_error.
    port_allocation allocate_port(uint16_t min_port, uint16_t max_port);

    // Binds one port on all interfaces; an empty fd means the port is in use.
    unique_fd try_listen(uint16_t port);

}  // namespace voxgate

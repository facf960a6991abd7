#pragma once

#include "log.hpp"
#include "port_allocator.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace voxgate {

    // Owns the worker's listening socket. Strictly sequential: one accepted connection is
    // handed out at a time and the caller closes it before asking for the next.
    class session_daemon {
      public:
        session_daemon(port_allocation allocation, std::chrono::seconds idle_timeout, const session_log& log);

        uint16_t port() const { return port_; }
        bool used_fallback() const { return used_fallback_; }
        std::chrono::seconds idle_timeout() const { return idle_timeout_; }

        // nullopt once `idle_timeout` passes without a connection.
        std::optional<unique_fd> wait_for_connection();

      private:
        unique_fd listener_{};
        uint16_t port_{};
        bool used_fallback_{false};
        std::chrono::seconds idle_timeout_{};
        const session_log& log_;
    };

}  // namespace voxgate

#include "voxgate/daemon.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <poll.h>
#include <sys/socket.h>
}

#include <cerrno>
#include <stdexcept>
#include <system_error>

using namespace voxgate::literals;

namespace voxgate {

    session_daemon::session_daemon(port_allocation allocation, std::chrono::seconds idle_timeout, const session_log& log)
            : listener_{std::move(allocation.socket)},
              port_{allocation.port},
              used_fallback_{allocation.used_fallback},
              idle_timeout_{idle_timeout},
              log_{log} {
        if (!listener_) {
            throw std::invalid_argument("session daemon needs a bound listener");
        }
    }

    std::optional<unique_fd> session_daemon::wait_for_connection() {
        auto deadline = std::chrono::steady_clock::now() + idle_timeout_;

        for (;;) {
            auto wait_ms = utils::poll_timeout_until(deadline);
            if (wait_ms == 0) {
                log_.write("No connection within {}s"_format(idle_timeout_.count()));
                return std::nullopt;
            }

            pollfd pfd{.fd = listener_.get(), .events = POLLIN, .revents = 0};
            int ret = ::poll(&pfd, 1, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "poll on listener failed");
            }
            if (ret == 0) {
                continue;
            }

            unique_fd conn{::accept4(listener_.get(), nullptr, nullptr, SOCK_CLOEXEC)};
            if (conn) {
                return conn;
            }

            // the peer may reset between poll and accept
            switch (errno) {
                case EINTR:
                case ECONNABORTED:
                case EAGAIN:
                case EPROTO:
                    continue;
                default:
                    throw std::system_error(errno, std::generic_category(), "accept failed");
            }
        }
    }

}  // namespace voxgate

#include "voxgate/port_allocator.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <netinet/in.h>
#include <sys/socket.h>
}

#include <cerrno>
#include <limits>
#include <stdexcept>
#include <system_error>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        static constexpr int listen_backlog = 8;

        static bool is_contention(int err) {
            return err == EADDRINUSE || err == EACCES;
        }

    }  // namespace detail

    unique_fd try_listen(uint16_t port) {
        unique_fd fd{::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)};
        if (!fd) {
            throw std::system_error(errno, std::generic_category(), "socket() failed");
        }

        int reuse = 1;
        if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
            throw std::system_error(errno, std::generic_category(), "setsockopt(SO_REUSEADDR) failed");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);

        if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
            auto err = errno;
            if (detail::is_contention(err)) {
                return {};
            }
            throw std::system_error(err, std::generic_category(), "bind() failed on port {}"_format(port));
        }

        if (::listen(fd.get(), detail::listen_backlog) != 0) {
            auto err = errno;
            if (detail::is_contention(err)) {
                return {};
            }
            throw std::system_error(err, std::generic_category(), "listen() failed on port {}"_format(port));
        }

        return fd;
    }

    port_allocation allocate_port(uint16_t min_port, uint16_t max_port) {
        if (min_port == 0U || min_port > max_port) {
            throw std::invalid_argument("invalid port range {}..{}"_format(min_port, max_port));
        }

        constexpr auto last_port = std::numeric_limits<uint16_t>::max();
        for (uint32_t port = min_port; port <= last_port; ++port) {
            auto fd = try_listen(static_cast<uint16_t>(port));
            if (fd) {
                return port_allocation{
                        .socket = std::move(fd),
                        .port = static_cast<uint16_t>(port),
                        .used_fallback = port > max_port};
            }
            debug_log("port ", port, " is taken");
        }

        throw std::system_error(
                EADDRINUSE, std::generic_category(), "no bindable port at or above {}"_format(min_port));
    }

}  // namespace voxgate

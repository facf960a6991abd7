#include "voxgate/handoff.hpp"

#include "voxgate/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
}

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace voxgate {

    namespace detail {

        // Ignores SIGPIPE while alive so a write to a departed invoker fails with EPIPE.
        class sigpipe_ignored {
          public:
            sigpipe_ignored() {
                struct sigaction ignore {};
                ignore.sa_handler = SIG_IGN;
                ::sigemptyset(&ignore.sa_mask);
                installed_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
            }

            ~sigpipe_ignored() {
                if (installed_) {
                    ::sigaction(SIGPIPE, &previous_, nullptr);
                }
            }

            sigpipe_ignored(const sigpipe_ignored&) = delete;
            sigpipe_ignored& operator=(const sigpipe_ignored&) = delete;

          private:
            struct sigaction previous_ {};
            bool installed_{false};
        };

    }  // namespace detail

    handoff_channel::handoff_channel() {
        int fds[2]{};
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe() failed");
        }
        read_end_.reset(fds[0]);
        write_end_.reset(fds[1]);
    }

    void handoff_channel::become_reader() {
        write_end_.reset();
    }

    void handoff_channel::become_writer() {
        read_end_.reset();
    }

    void handoff_channel::publish(std::string_view url) {
        if (published_) {
            throw std::logic_error("handoff already published");
        }
        if (!write_end_) {
            throw std::logic_error("handoff write end is closed");
        }

        std::string line{url};
        line.push_back('\n');
        std::string_view remaining{line};
        detail::sigpipe_ignored guard{};
        while (!remaining.empty()) {
            auto n = ::write(write_end_.get(), remaining.data(), remaining.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "handoff write failed");
            }
            remaining.remove_prefix(static_cast<std::size_t>(n));
        }

        published_ = true;
        write_end_.reset();
    }

    void handoff_channel::abandon() {
        write_end_.reset();
    }

    std::optional<std::string> handoff_channel::await(std::chrono::milliseconds timeout) {
        if (consumed_) {
            throw std::logic_error("handoff already consumed");
        }
        if (!read_end_) {
            throw std::logic_error("handoff read end is closed");
        }
        consumed_ = true;

        std::string buffer{};
        auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;) {
            if (auto newline = buffer.find('\n'); newline != std::string::npos) {
                read_end_.reset();
                return buffer.substr(0, newline);
            }

            auto wait_ms = utils::poll_timeout_until(deadline);
            if (wait_ms == 0) {
                break;
            }

            pollfd pfd{.fd = read_end_.get(), .events = POLLIN, .revents = 0};
            int ret = ::poll(&pfd, 1, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "handoff poll failed");
            }
            if (ret == 0) {
                break;
            }

            char chunk[512]{};
            auto n = ::read(read_end_.get(), chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category(), "handoff read failed");
            }
            if (n == 0) {
                debug_log("handoff writer closed after ", buffer.size(), " bytes");
                break;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
        }

        read_end_.reset();
        return std::nullopt;
    }

}  // namespace voxgate

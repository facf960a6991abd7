#include "voxgate/supervisor.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        static bool redirect_to(const char* path, int flags, int target_fd) {
            auto fd = ::open(path, flags | O_CLOEXEC, 0644);
            if (fd < 0) {
                return false;
            }
            auto ok = ::dup2(fd, target_fd) >= 0;
            ::close(fd);
            return ok;
        }

    }  // namespace detail

    void posix_detach_platform::die(std::string_view message) const {
        log_.write("{}: {}"_format(message, std::strerror(errno)));
        _exit(1);
    }

    void posix_detach_platform::become_intermediate() const {
        if (!detail::redirect_to("/dev/null", O_RDONLY, STDIN_FILENO)) {
            die("Can't read /dev/null"sv);
        }
        if (!detail::redirect_to("/dev/null", O_WRONLY, STDOUT_FILENO)) {
            die("Can't write to /dev/null"sv);
        }

        auto pid = ::fork();
        if (pid < 0) {
            die("Can't fork"sv);
        }
        if (pid > 0) {
            _exit(0);
        }
    }

    void posix_detach_platform::become_worker() const {
        if (::setsid() < 0) {
            die("Can't start a new session"sv);
        }

        if (log_.enabled()) {
            auto path = log_.stderr_path();
            if (!detail::redirect_to(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, STDERR_FILENO)) {
                die("Can't make stderr go to {}"_format(path.string()));
            }
        }
        else if (::dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
            die("Can't dup stdout"sv);
        }
    }

    process_role posix_detach_platform::spawn_detached() {
        // flush so buffered invoker output is not emitted twice
        std::fflush(nullptr);

        auto pid = ::fork();
        if (pid < 0) {
            throw std::system_error(errno, std::generic_category(), "fork failed");
        }

        if (pid > 0) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw std::system_error(errno, std::generic_category(), "waitpid failed");
                }
            }
            if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                throw std::runtime_error("detach failed in intermediate process");
            }
            return process_role::invoker;
        }

        become_intermediate();
        become_worker();
        return process_role::worker;
    }

    process_role process_supervisor::detach() {
        if (detached_) {
            throw std::logic_error("a worker was already spawned for this conversation");
        }
        detached_ = true;

        auto role = platform_.spawn_detached();
        if (role == process_role::invoker) {
            channel_.become_reader();
        }
        else {
            channel_.become_writer();
            log_.write("Worker detached as pid {}"_format(static_cast<long>(::getpid())));
        }
        return role;
    }

}  // namespace voxgate

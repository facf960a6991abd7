#pragma once

#include "voxgate/cgi.hpp"
#include "voxgate/config.hpp"
#include "voxgate/http.hpp"
#include "voxgate/log.hpp"
#include "voxgate/port_allocator.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace voxgate::test::detail {

    namespace fs = std::filesystem;

    // Ports the suites bind on; high enough to stay clear of anything the host runs.
    inline constexpr uint16_t test_min_port = 38100;
    inline constexpr uint16_t test_max_port = 38400;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline unique_fd connect_loopback(uint16_t port) {
        unique_fd fd{::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)};
        if (!fd) {
            return {};
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
            return {};
        }
        return fd;
    }

    inline std::string read_until_close(int fd, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
        std::string out{};
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                return out;
            }
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            if (::poll(&pfd, 1, static_cast<int>(remaining)) <= 0) {
                return out;
            }
            char chunk[4096]{};
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                return out;
            }
            out.append(chunk, static_cast<std::size_t>(n));
        }
    }

    // One client round trip: connect, send `request`, read the whole response.
    inline std::string exchange(uint16_t port, std::string_view request) {
        auto fd = connect_loopback(port);
        if (!fd) {
            return {};
        }
        if (!http::write_all(fd.get(), request)) {
            return {};
        }
        return read_until_close(fd.get());
    }

    inline std::size_t count_occurrences(std::string_view haystack, std::string_view needle) {
        std::size_t count{};
        for (auto pos = haystack.find(needle); pos != std::string_view::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

}  // namespace voxgate::test::detail

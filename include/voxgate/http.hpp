#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace voxgate {

    class unique_fd {
      public:
        unique_fd() = default;
        explicit unique_fd(int fd) : fd_{fd} {}
        ~unique_fd() { reset(); }

        unique_fd(const unique_fd&) = delete;
        unique_fd& operator=(const unique_fd&) = delete;

        unique_fd(unique_fd&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
        unique_fd& operator=(unique_fd&& other) noexcept {
            if (this != &other) {
                reset(std::exchange(other.fd_, -1));
            }
            return *this;
        }

        int get() const { return fd_; }
        explicit operator bool() const { return fd_ >= 0; }

        int release() { return std::exchange(fd_, -1); }
        void reset(int fd = -1);

      private:
        int fd_{-1};
    };

    using query_map = std::map<std::string, std::string, std::less<>>;

    struct turn_request {
        std::string method{};
        std::string target{};
        std::string raw_query{};
        query_map query{};
        std::map<std::string, std::string, std::less<>> headers{};
        std::optional<std::string> body{};
    };

    namespace http {

        inline constexpr std::size_t max_header_bytes = 64U * 1024U;
        inline constexpr std::size_t max_body_bytes = 16U * 1024U * 1024U;

        // `+` becomes a space, `%XX` is decoded; nullopt on a truncated or non-hex escape.
        std::optional<std::string> url_decode(std::string_view text);

        std::string url_encode(std::string_view text);

        std::optional<query_map> parse_query(std::string_view query);

        // Parses the request line and headers of `head` (everything before the blank line).
        std::optional<turn_request> parse_request_head(std::string_view head);

        // Full request text, including any body.
        std::optional<turn_request> parse_request(std::string_view raw);

        // Reads one request from a connected socket; nullopt when the peer goes away,
        // sends garbage, or stalls past `timeout`.
        std::optional<turn_request> read_request(int fd, std::chrono::milliseconds timeout);

        std::string_view reason_phrase(int status);

        std::string make_response(int status, std::string_view body);
        std::string make_error_response(int status);

        bool write_all(int fd, std::string_view data);

        std::string escape_markup(std::string_view text);

        std::string make_absolute_url(std::string_view origin_url, std::string_view url);

    }  // namespace http

}  // namespace voxgate

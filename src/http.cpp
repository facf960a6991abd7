#include "voxgate/http.hpp"

#include "voxgate/format.hpp"

extern "C" {
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
}

#include <cerrno>

using namespace voxgate::literals;

namespace voxgate {

    void unique_fd::reset(int fd) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

}  // namespace voxgate

namespace voxgate::http {

    using namespace std::string_view_literals;

    namespace detail {

        static constexpr int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

        static std::string to_lower(std::string_view text) {
            std::string out{};
            out.reserve(text.size());
            for (auto c : text) {
                out.push_back(utils::char_tolower(c));
            }
            return out;
        }

        struct head_split {
            std::string_view head{};
            std::size_t body_offset{};
        };

        static std::optional<head_split> split_head(std::string_view raw) {
            auto crlf = raw.find("\r\n\r\n"sv);
            auto lf = raw.find("\n\n"sv);
            if (crlf == std::string_view::npos && lf == std::string_view::npos) {
                return std::nullopt;
            }
            if (crlf != std::string_view::npos && (lf == std::string_view::npos || crlf < lf)) {
                return head_split{.head = raw.substr(0, crlf), .body_offset = crlf + 4U};
            }
            return head_split{.head = raw.substr(0, lf), .body_offset = lf + 2U};
        }

        static std::optional<std::size_t> content_length(const turn_request& request) {
            auto it = request.headers.find("content-length"sv);
            if (it == request.headers.end()) {
                return std::size_t{0};
            }
            return utils::parse_integer<std::size_t>(utils::trim_view(it->second));
        }

    }  // namespace detail

    std::optional<std::string> url_decode(std::string_view text) {
        std::string out{};
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            auto c = text[i];
            if (c == '+') {
                out.push_back(' ');
                continue;
            }
            if (c != '%') {
                out.push_back(c);
                continue;
            }
            if (i + 2U >= text.size()) {
                return std::nullopt;
            }
            auto hi = detail::hex_value(text[i + 1U]);
            auto lo = detail::hex_value(text[i + 2U]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2U;
        }
        return out;
    }

    std::string url_encode(std::string_view text) {
        static constexpr auto hex_digits = "0123456789ABCDEF"sv;
        std::string out{};
        out.reserve(text.size());
        for (auto c : text) {
            auto uc = static_cast<unsigned char>(c);
            if ((uc >= 'a' && uc <= 'z') || (uc >= 'A' && uc <= 'Z') || (uc >= '0' && uc <= '9') || uc == '-' ||
                uc == '_' || uc == '.' || uc == '~') {
                out.push_back(c);
            }
            else {
                out.push_back('%');
                out.push_back(hex_digits[uc >> 4U]);
                out.push_back(hex_digits[uc & 0x0FU]);
            }
        }
        return out;
    }

    std::optional<query_map> parse_query(std::string_view query) {
        query_map out{};
        while (!query.empty()) {
            auto amp = query.find('&');
            auto pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1U);
            if (pair.empty()) {
                continue;
            }

            auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::optional<std::string>{std::string{}}
                                                      : url_decode(pair.substr(eq + 1U));
            if (!key || !value) {
                return std::nullopt;
            }
            // first occurrence wins
            out.emplace(std::move(*key), std::move(*value));
        }
        return out;
    }

    std::optional<turn_request> parse_request_head(std::string_view head) {
        auto line_end = head.find('\n');
        auto request_line = utils::trim_right_view(head.substr(0, line_end));

        auto first_space = request_line.find(' ');
        if (first_space == std::string_view::npos || first_space == 0U) {
            return std::nullopt;
        }
        auto second_space = request_line.find(' ', first_space + 1U);
        if (second_space == std::string_view::npos) {
            return std::nullopt;
        }

        auto version = request_line.substr(second_space + 1U);
        if (!version.starts_with("HTTP/"sv)) {
            return std::nullopt;
        }

        turn_request request{};
        request.method = std::string(request_line.substr(0, first_space));
        request.target = std::string(request_line.substr(first_space + 1U, second_space - first_space - 1U));
        if (request.target.empty()) {
            return std::nullopt;
        }

        if (auto q = request.target.find('?'); q != std::string::npos) {
            request.raw_query = request.target.substr(q + 1U);
        }

        // a malformed query is the turn logic's concern, not the transport's
        if (auto parsed = parse_query(request.raw_query)) {
            request.query = std::move(*parsed);
        }

        auto rest = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 1U);
        while (!rest.empty()) {
            auto end = rest.find('\n');
            auto line = utils::trim_right_view(rest.substr(0, end));
            rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 1U);
            if (line.empty()) {
                continue;
            }
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                return std::nullopt;
            }
            request.headers.emplace(
                    detail::to_lower(utils::trim_view(line.substr(0, colon))),
                    std::string(utils::trim_view(line.substr(colon + 1U))));
        }

        return request;
    }

    std::optional<turn_request> parse_request(std::string_view raw) {
        auto split = detail::split_head(raw);
        if (!split) {
            return std::nullopt;
        }

        auto request = parse_request_head(split->head);
        if (!request) {
            return std::nullopt;
        }

        auto length = detail::content_length(*request);
        if (!length || *length > max_body_bytes) {
            return std::nullopt;
        }
        if (*length > 0U) {
            auto body = raw.substr(split->body_offset);
            if (body.size() < *length) {
                return std::nullopt;
            }
            request->body = std::string(body.substr(0, *length));
        }
        return request;
    }

    std::optional<turn_request> read_request(int fd, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        std::string buffer{};
        std::optional<turn_request> request{};
        std::size_t body_offset{};
        std::size_t expected_body{};

        for (;;) {
            if (!request) {
                if (auto split = detail::split_head(buffer)) {
                    request = parse_request_head(split->head);
                    if (!request) {
                        return std::nullopt;
                    }
                    auto length = detail::content_length(*request);
                    if (!length || *length > max_body_bytes) {
                        return std::nullopt;
                    }
                    body_offset = split->body_offset;
                    expected_body = *length;
                }
                else if (buffer.size() > max_header_bytes) {
                    return std::nullopt;
                }
            }

            if (request && buffer.size() - body_offset >= expected_body) {
                if (expected_body > 0U) {
                    request->body = buffer.substr(body_offset, expected_body);
                }
                return request;
            }

            auto wait_ms = utils::poll_timeout_until(deadline);
            if (wait_ms == 0) {
                return std::nullopt;
            }

            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            int ret = ::poll(&pfd, 1, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::nullopt;
            }
            if (ret == 0) {
                return std::nullopt;
            }

            char chunk[4096]{};
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return std::nullopt;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
        }
    }

    std::string_view reason_phrase(int status) {
        switch (status) {
            case 200:
                return "OK"sv;
            case 400:
                return "Bad Request"sv;
            case 403:
                return "Forbidden"sv;
            case 404:
                return "Not Found"sv;
            case 500:
                return "Internal Server Error"sv;
            case 502:
                return "Bad Gateway"sv;
            case 504:
                return "Gateway Timeout"sv;
            default:
                return "Unknown"sv;
        }
    }

    std::string make_response(int status, std::string_view body) {
        return "HTTP/1.1 {} {}\r\n"
               "Server: voxgate/" VOXGATE_VERSION "\r\n"
               "Cache-Control: no-cache\r\n"
               "Content-Type: text/vxml\r\n"
               "Content-Length: {}\r\n"
               "Connection: close\r\n"
               "\r\n"
               "{}"_format(status, reason_phrase(status), body.size(), body);
    }

    std::string make_error_response(int status) {
        auto body = "<title>{0} {1}</title>\n<h1>{0} {1}</h1>\n"_format(status, reason_phrase(status));
        return "HTTP/1.1 {} {}\r\n"
               "Server: voxgate/" VOXGATE_VERSION "\r\n"
               "Content-Type: text/html\r\n"
               "Content-Length: {}\r\n"
               "Connection: close\r\n"
               "\r\n"
               "{}"_format(status, reason_phrase(status), body.size(), body);
    }

    bool write_all(int fd, std::string_view data) {
        while (!data.empty()) {
            auto n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return true;
    }

    std::string escape_markup(std::string_view text) {
        std::string out{};
        out.reserve(text.size());
        for (auto c : text) {
            switch (c) {
                case '&':
                    out += "&amp;"sv;
                    break;
                case '"':
                    out += "&quot;"sv;
                    break;
                case '>':
                    out += "&gt;"sv;
                    break;
                case '<':
                    out += "&lt;"sv;
                    break;
                default:
                    out.push_back(c);
                    break;
            }
        }
        return out;
    }

    std::string make_absolute_url(std::string_view origin_url, std::string_view url) {
        if (url == "_home"sv) {
            return std::string(url);
        }

        if (url.size() >= 2U && (url.front() == '\'' || url.front() == '"') &&
            (url.back() == '\'' || url.back() == '"')) {
            url = url.substr(1U, url.size() - 2U);
        }

        auto lowered = detail::to_lower(url.substr(0, 8U));
        if (lowered.starts_with("http:"sv) || lowered.starts_with("https:"sv)) {
            return std::string(url);
        }

        if (origin_url.empty()) {
            return std::string(url);
        }

        std::string result{origin_url};
        auto scheme_end = result.find("://"sv);
        auto host_start = scheme_end == std::string::npos ? std::size_t{0} : scheme_end + 3U;
        auto path_start = result.find('/', host_start);
        if (url.starts_with('/')) {
            if (path_start != std::string::npos) {
                result.erase(path_start);
            }
        }
        else if (path_start == std::string::npos) {
            result.push_back('/');
        }
        else {
            result.erase(result.rfind('/') + 1U);
        }
        result += url;
        return result;
    }

}  // namespace voxgate::http

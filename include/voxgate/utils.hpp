#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <unistd.h>
}

namespace voxgate {

// Developer traces to stderr, tagged with the pid since invoker and worker share the terminal
// until the worker detaches. Compiled out under NDEBUG.
#ifndef NDEBUG
    constexpr std::string_view source_basename(const std::source_location& loc) {
        std::string_view path{loc.file_name()};
        if (auto slash = path.rfind('/'); slash != path.npos) {
            path.remove_prefix(slash + 1);
        }
        return path;
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            std::cerr << "[voxgate " << ::getpid() << ' ' << source_basename(loc) << ':' << loc.line() << "] ";
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr std::string_view trim_right_view(std::string_view value) {
            auto last = value.find_last_not_of(" \t\r\n");
            if (last == std::string_view::npos) {
                return {};
            }
            return value.substr(0, last + 1U);
        }

        // Whole-string decimal parse; trailing text or overflow gives nullopt.
        template <std::integral T>
        constexpr std::optional<T> parse_integer(std::string_view input) {
            T value{};
            auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
            if (ec != std::errc{} || ptr != input.data() + input.size()) {
                return std::nullopt;
            }
            return value;
        }

        // Milliseconds left before `deadline`, clamped to what poll() accepts. Zero once the
        // deadline has passed, never negative.
        inline int poll_timeout_until(std::chrono::steady_clock::time_point deadline) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                return 0;
            }
            return static_cast<int>(std::min<int64_t>(remaining, std::numeric_limits<int>::max()));
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace voxgate

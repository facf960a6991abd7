#pragma once

#include "utils.hpp"

#include <array>
#include <format>
#include <type_traits>

namespace voxgate {
    // Types exposing `to_string()` (endpoints, directives) format through std::format directly.
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept to_string_formattable = U::to_string_formattable && requires(U a) {
        { a.to_string() } -> std::convertible_to<std::string_view>;
    };

    // Mode and state enums with a free `to_string` found by ADL, so logs read "proxied" rather than 1.
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept named_enum = std::is_enum_v<U> && requires(U v) {
        { to_string(v) } -> std::convertible_to<std::string_view>;
    };

    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        // "http://{}:{}/"_format(host, port)
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals
}  // namespace voxgate

namespace std {
    template <voxgate::to_string_formattable T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const {
            auto text = val.to_string();
            return formatter<std::string_view>::format(std::string_view{text}, ctx);
        }
    };

    template <voxgate::named_enum T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(T val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(std::string_view{to_string(val)}, ctx);
        }
    };
}  // namespace std

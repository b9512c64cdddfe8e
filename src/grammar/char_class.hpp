#pragma once

// Byte classes of the COS lexical grammar, and the cursor helpers every
// decoder shares.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace cos_cpp::grammar {

using Input = std::span<const std::byte>;

inline auto to_u8(std::byte b) -> std::uint8_t { return static_cast<std::uint8_t>(b); }

// NUL, HT, LF, FF, CR, SP.
constexpr auto is_whitespace(std::uint8_t c) noexcept -> bool {
    return c == 0x00 || c == 0x09 || c == 0x0A || c == 0x0C || c == 0x0D || c == 0x20;
}

constexpr auto is_eol(std::uint8_t c) noexcept -> bool {
    return c == '\n' || c == '\r';
}

// ( ) < > [ ] { } / %
constexpr auto is_delimiter(std::uint8_t c) noexcept -> bool {
    switch (c) {
        case '(': case ')': case '<': case '>':
        case '[': case ']': case '{': case '}':
        case '/': case '%':
            return true;
        default:
            return false;
    }
}

// Bytes that may appear unescaped inside a name.
constexpr auto is_name_char(std::uint8_t c) noexcept -> bool {
    return c >= 0x21 && c <= 0x7E && !is_delimiter(c);
}

// A byte that ends a keyword or number token.
constexpr auto is_token_boundary(std::uint8_t c) noexcept -> bool {
    return is_whitespace(c) || is_delimiter(c);
}

constexpr auto is_digit(std::uint8_t c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

constexpr auto is_octal_digit(std::uint8_t c) noexcept -> bool {
    return c >= '0' && c <= '7';
}

constexpr auto hex_value(std::uint8_t c) noexcept -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

constexpr auto ascii_lower(std::uint8_t c) noexcept -> std::uint8_t {
    return (c >= 'A' && c <= 'Z') ? static_cast<std::uint8_t>(c - 'A' + 'a') : c;
}

// Skip whitespace and `%` comments (a comment runs to the end of its line).
// Returns the position of the first significant byte.
inline auto skip_whitespace(Input in, std::size_t pos = 0) -> std::size_t {
    while (pos < in.size()) {
        auto c = to_u8(in[pos]);
        if (is_whitespace(c)) {
            ++pos;
        } else if (c == '%') {
            while (pos < in.size() && !is_eol(to_u8(in[pos]))) ++pos;
        } else {
            break;
        }
    }
    return pos;
}

// Check whether `literal` occurs at `pos`. ASCII case folding when
// `ignore_case` is set.
inline auto starts_with(Input in, std::size_t pos, std::string_view literal,
                        bool ignore_case = false) -> bool {
    if (pos > in.size() || in.size() - pos < literal.size()) return false;
    for (std::size_t i = 0; i < literal.size(); ++i) {
        auto c = to_u8(in[pos + i]);
        auto l = static_cast<std::uint8_t>(literal[i]);
        if (ignore_case ? ascii_lower(c) != ascii_lower(l) : c != l) return false;
    }
    return true;
}

// Consume one end-of-line marker (CRLF, LF or CR) at `pos`.
// Returns the number of bytes consumed (0 if there is none).
inline auto eol_length(Input in, std::size_t pos) -> std::size_t {
    if (pos >= in.size()) return 0;
    if (to_u8(in[pos]) == '\r') {
        return (pos + 1 < in.size() && to_u8(in[pos + 1]) == '\n') ? 2 : 1;
    }
    return to_u8(in[pos]) == '\n' ? 1 : 0;
}

inline auto as_input(std::string_view s) -> Input {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

}  // namespace cos_cpp::grammar

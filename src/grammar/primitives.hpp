#pragma once

// Decoders for the non-recursive COS tokens: null, booleans, numbers,
// names, both string forms and indirect references.
//
// Every decoder takes the whole input plus a start position, skips
// whitespace, and returns the decoded value with the position just past
// it. A decoder that does not recognize its opening token fails with
// unexpected_token; one that recognized it but found it malformed fails
// with the specific kind.
//
// Internal header, not installed.

#include "char_class.hpp"

#include <cos-cpp/error.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace cos_cpp::grammar {

// A decoded value and the position just past it.
struct Token {
    Value value;
    std::size_t end;
};

inline auto at_offset(std::size_t pos) -> std::string {
    return " at offset " + std::to_string(pos);
}

inline auto no_match(std::string_view expected, std::size_t pos) -> Error {
    return Error{ErrorKind::unexpected_token, "expected " + std::string{expected} + at_offset(pos)};
}

inline auto text_of(Input in, std::size_t begin, std::size_t end) -> std::string_view {
    return {reinterpret_cast<const char*>(in.data() + begin), end - begin};
}

// -- null / true / false ------------------------------------------------------

inline auto decode_null(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    if (!starts_with(in, pos, "null", true)) return no_match("null", pos);
    return Token{Value{Null{}}, pos + 4};
}

inline auto decode_boolean(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    if (starts_with(in, pos, "true", true)) return Token{Value{true}, pos + 4};
    if (starts_with(in, pos, "false", true)) return Token{Value{false}, pos + 5};
    return no_match("boolean", pos);
}

// -- Numbers ------------------------------------------------------------------

// [+-]? (digits ('.' digits?)? | '.' digits)
// Integer when there is no '.' and the value fits in int64_t, real otherwise.
inline auto decode_number(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    auto p = pos;
    auto negative = false;
    if (p < in.size() && (to_u8(in[p]) == '+' || to_u8(in[p]) == '-')) {
        negative = to_u8(in[p]) == '-';
        ++p;
    }
    auto digits_begin = p;
    auto int_digits = std::size_t{0};
    while (p < in.size() && is_digit(to_u8(in[p]))) { ++p; ++int_digits; }

    auto has_point = false;
    auto frac_digits = std::size_t{0};
    if (p < in.size() && to_u8(in[p]) == '.') {
        has_point = true;
        ++p;
        while (p < in.size() && is_digit(to_u8(in[p]))) { ++p; ++frac_digits; }
    }

    if (int_digits == 0 && frac_digits == 0) {
        if (p == pos) return no_match("number", pos);
        return Error{ErrorKind::malformed_literal,
                     "number without digits '" + std::string{text_of(in, pos, p)} + "'" + at_offset(pos)};
    }

    // from_chars takes '-' but not '+', so the '+' is dropped. Missing
    // digits around the point are filled in: ".5" reads as "0.5".
    auto text = std::string{negative ? "-" : ""};
    if (int_digits == 0) text += '0';
    text += text_of(in, digits_begin, p);
    if (has_point && frac_digits == 0) text += '0';
    const auto* first = text.data();
    const auto* last = text.data() + text.size();

    if (!has_point) {
        auto i = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(first, last, i);
        if (ec == std::errc{} && ptr == last) return Token{Value{i}, p};
    }

    auto d = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorKind::malformed_literal,
                     "number out of range '" + text + "'" + at_offset(pos)};
    }
    return Token{Value{d}, p};
}

// -- Names --------------------------------------------------------------------

inline auto decode_name(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    if (pos >= in.size() || to_u8(in[pos]) != '/') return no_match("name", pos);

    auto p = pos + 1;
    auto label = std::string{};
    while (p < in.size() && is_name_char(to_u8(in[p]))) {
        auto c = to_u8(in[p]);
        if (c != '#') {
            label.push_back(static_cast<char>(c));
            ++p;
            continue;
        }
        // #XX: both digits must be present and must be hex.
        auto hi = (p + 1 < in.size()) ? hex_value(to_u8(in[p + 1])) : std::nullopt;
        auto lo = (p + 2 < in.size()) ? hex_value(to_u8(in[p + 2])) : std::nullopt;
        if (!hi || !lo) {
            return Error{ErrorKind::malformed_name, "invalid #XX escape in name" + at_offset(p)};
        }
        label.push_back(static_cast<char>((*hi << 4) | *lo));
        p += 3;
    }
    return Token{Value{Name{std::move(label)}}, p};
}

// -- Strings ------------------------------------------------------------------

// ( ... ) with balanced parentheses and backslash escapes.
inline auto decode_literal_string(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    if (pos >= in.size() || to_u8(in[pos]) != '(') return no_match("literal string", pos);

    auto out = Bytes{};
    auto depth = 1;
    auto p = pos + 1;
    while (p < in.size()) {
        auto c = to_u8(in[p]);
        if (c == '\\') {
            ++p;
            if (p >= in.size()) break;
            auto e = to_u8(in[p]);
            switch (e) {
                case 'n': out.push_back(std::byte{'\n'}); ++p; break;
                case 'r': out.push_back(std::byte{'\r'}); ++p; break;
                case 't': out.push_back(std::byte{'\t'}); ++p; break;
                case 'b': out.push_back(std::byte{'\b'}); ++p; break;
                case 'f': out.push_back(std::byte{'\f'}); ++p; break;
                case '\r':
                case '\n':
                    // Line continuation: backslash-EOL contributes nothing.
                    p += eol_length(in, p);
                    break;
                default:
                    if (is_octal_digit(e)) {
                        auto code = 0u;
                        for (auto n = 0; n < 3 && p < in.size() && is_octal_digit(to_u8(in[p])); ++n, ++p) {
                            code = code * 8 + (to_u8(in[p]) - '0');
                        }
                        out.push_back(static_cast<std::byte>(code & 0xFF));
                    } else {
                        // \( \) \\ and any unknown escape: the backslash is dropped.
                        out.push_back(in[p]);
                        ++p;
                    }
                    break;
            }
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) {
                return Token{Value{String::from_bytes(std::move(out), StringForm::literal)}, p + 1};
            }
        } else if (c == '\r') {
            // An unescaped CR or CRLF reads as a single LF.
            out.push_back(std::byte{'\n'});
            p += eol_length(in, p);
            continue;
        }
        out.push_back(in[p]);
        ++p;
    }
    return Error{ErrorKind::malformed_string, "unterminated literal string starting" + at_offset(pos)};
}

// < hex digits and whitespace >
inline auto decode_hex_string(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    if (pos >= in.size() || to_u8(in[pos]) != '<') return no_match("hex string", pos);
    if (pos + 1 < in.size() && to_u8(in[pos + 1]) == '<') return no_match("hex string", pos);

    auto out = Bytes{};
    auto pending = std::optional<std::uint8_t>{};
    for (auto p = pos + 1; p < in.size(); ++p) {
        auto c = to_u8(in[p]);
        if (c == '>') {
            if (pending) {
                return Error{ErrorKind::malformed_string,
                             "hex string has an odd number of digits" + at_offset(pos)};
            }
            return Token{Value{String::from_bytes(std::move(out), StringForm::hex)}, p + 1};
        }
        if (is_whitespace(c)) continue;
        auto v = hex_value(c);
        if (!v) {
            return Error{ErrorKind::malformed_string, "invalid hex digit in string" + at_offset(p)};
        }
        if (pending) {
            out.push_back(static_cast<std::byte>((*pending << 4) | *v));
            pending.reset();
        } else {
            pending = v;
        }
    }
    return Error{ErrorKind::malformed_string, "unterminated hex string starting" + at_offset(pos)};
}

inline auto decode_string(Input in, std::size_t pos) -> Result<Token> {
    auto p = skip_whitespace(in, pos);
    if (p < in.size() && to_u8(in[p]) == '(') return decode_literal_string(in, p);
    return decode_hex_string(in, p);
}

// -- Indirect references ------------------------------------------------------

namespace detail {

inline auto read_unsigned(Input in, std::size_t& p) -> std::optional<std::uint64_t> {
    auto begin = p;
    while (p < in.size() && is_digit(to_u8(in[p]))) ++p;
    if (p == begin) return std::nullopt;
    auto text = text_of(in, begin, p);
    auto value = std::uint64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{}) return std::nullopt;
    return value;
}

}  // namespace detail

// digits WS digits WS 'R'
inline auto decode_reference(Input in, std::size_t pos) -> Result<Token> {
    pos = skip_whitespace(in, pos);
    auto p = pos;

    auto number = detail::read_unsigned(in, p);
    if (!number) return no_match("reference", pos);
    auto after_number = p;
    p = skip_whitespace(in, p);
    if (p == after_number) return no_match("reference", pos);

    auto generation = detail::read_unsigned(in, p);
    if (!generation) return no_match("reference", pos);
    auto after_generation = p;
    p = skip_whitespace(in, p);
    if (p == after_generation) return no_match("reference", pos);

    if (p >= in.size() || to_u8(in[p]) != 'R') return no_match("reference", pos);
    ++p;
    if (p < in.size() && !is_token_boundary(to_u8(in[p]))) return no_match("reference", pos);

    return Token{Value{Reference{ObjectId{*number, *generation}}}, p};
}

}  // namespace cos_cpp::grammar

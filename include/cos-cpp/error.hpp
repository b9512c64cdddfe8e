/// @file error.hpp
/// @brief Error types and the Result wrapper for the cos-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cos_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_literal,       ///< Bad null/boolean/number spelling.
    malformed_string,        ///< Unterminated string, bad hex digit or odd hex count.
    malformed_name,          ///< Invalid `#XX` escape in a name.
    unterminated_container,  ///< Array, dictionary or stream missing its closing delimiter.
    dangling_reference,      ///< A reference names an identity absent from the table.
    unsupported_filter,      ///< A stream filter that is not implemented.
    depth_exceeded,          ///< The nesting bound was tripped.
    unexpected_token,        ///< No decoder matched, or trailing data after a value.
    filter_error,            ///< Corrupt filtered data, or decoded output too large.
    invalid_document,        ///< The file could not be split into objects and trailer.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_literal:      return "malformed_literal";
        case ErrorKind::malformed_string:       return "malformed_string";
        case ErrorKind::malformed_name:         return "malformed_name";
        case ErrorKind::unterminated_container: return "unterminated_container";
        case ErrorKind::dangling_reference:     return "dangling_reference";
        case ErrorKind::unsupported_filter:     return "unsupported_filter";
        case ErrorKind::depth_exceeded:         return "depth_exceeded";
        case ErrorKind::unexpected_token:       return "unexpected_token";
        case ErrorKind::filter_error:           return "filter_error";
        case ErrorKind::invalid_document:       return "invalid_document";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Either a value of type T or the Error that prevented producing one.
///
/// Every fallible operation in the library returns a Result; nothing
/// throws for malformed input.
///
/// @code
/// auto parsed = cos_cpp::parse_object("<< /Type /Catalog >>");
/// if (!parsed) {
///     std::fprintf(stderr, "%s\n", parsed.error().message.c_str());
/// }
/// @endcode
template <typename T>
class Result {
public:
    Result(T value) : inner_{std::in_place_index<0>, std::move(value)} {}
    Result(Error error) : inner_{std::in_place_index<1>, std::move(error)} {}

    auto has_value() const -> bool { return inner_.index() == 0; }
    explicit operator bool() const { return has_value(); }

    auto value() & -> T& { return std::get<0>(inner_); }
    auto value() const& -> const T& { return std::get<0>(inner_); }
    auto value() && -> T&& { return std::get<0>(std::move(inner_)); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }

    auto operator->() -> T* { return &std::get<0>(inner_); }
    auto operator->() const -> const T* { return &std::get<0>(inner_); }

    /// The error. Only valid when has_value() is false.
    auto error() const -> const Error& { return std::get<1>(inner_); }

private:
    std::variant<T, Error> inner_;
};

}  // namespace cos_cpp

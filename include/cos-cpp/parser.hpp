/// @file parser.hpp
/// @brief The COS value grammar parser.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/value.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace cos_cpp {

/// A decoded value plus the number of input bytes it consumed.
///
/// The unconsumed remainder is `input.subspan(bytes_read)`; it keeps any
/// whitespace that follows the value.
struct DecodeResult {
    Value value;
    std::size_t bytes_read;
};

/// Decode one value from the start of `input`.
///
/// Leading whitespace and comments are skipped. Candidate decoders are
/// tried in a fixed order (Reference, Stream, Dictionary, String, Name,
/// Array, Null, Boolean, Number); the first that succeeds wins. If none
/// does, the most specific failure is reported.
///
/// @code
/// auto r = cos_cpp::parse_value("1 2 R/Name");
/// // r->value holds Reference{1, 2}; r->bytes_read == 5
/// @endcode
auto parse_value(std::span<const std::byte> input, const ParseLimits& limits = {})
    -> Result<DecodeResult>;

/// Text convenience overload of parse_value().
auto parse_value(std::string_view input, const ParseLimits& limits = {})
    -> Result<DecodeResult>;

/// Decode the complete body of an indirect object.
///
/// The body must hold exactly one value; anything but whitespace and
/// comments after it is an unexpected_token error. The returned tree may
/// contain Reference placeholders anywhere below its root.
auto parse_object(std::span<const std::byte> input, const ParseLimits& limits = {})
    -> Result<Value>;

/// Text convenience overload of parse_object().
auto parse_object(std::string_view input, const ParseLimits& limits = {})
    -> Result<Value>;

}  // namespace cos_cpp

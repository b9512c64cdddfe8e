/// @file limits.hpp
/// @brief Resource bounds applied while parsing and decoding untrusted input.

#pragma once

#include <cstddef>

namespace cos_cpp {

/// Bounds that turn pathological input into a reported error.
///
/// @code
/// auto limits = cos_cpp::ParseLimits{};
/// limits.max_depth = 32;
/// auto value = cos_cpp::parse_object(bytes, limits);
/// @endcode
struct ParseLimits {
    /// Maximum nesting of arrays and dictionaries (streams count their dictionary).
    std::size_t max_depth = 256;

    /// Maximum size of a decoded stream payload, per filter stage.
    std::size_t max_decoded_size = std::size_t{64} * 1024 * 1024;

    /// Maximum number of indirect objects accepted from one file.
    std::size_t max_objects = 1'000'000;
};

}  // namespace cos_cpp

/// @file writer.hpp
/// @brief Serialization of values back to COS syntax.

#pragma once

#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <string>

namespace cos_cpp {

/// Serialize a value to COS syntax.
///
/// Names are re-escaped with `#XX`, literal strings with backslash escapes,
/// hex-form strings are written in hex. References and Links are written as
/// `N G R` and never expanded, so cyclic graphs serialize finitely. Reals
/// use the shortest text that reads back to the same double.
auto to_cos_string(const Value& value) -> std::string;

/// Serialize an indirect object: `N G obj`, the value, `endobj`.
auto write_object(const ObjectId& id, const Value& value) -> std::string;

}  // namespace cos_cpp

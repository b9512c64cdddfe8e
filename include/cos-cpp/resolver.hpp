/// @file resolver.hpp
/// @brief Reference resolution across a table of indirect objects.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <memory>
#include <optional>

namespace cos_cpp {

/// Replace every Reference placeholder in every object of `table` with a
/// Link to the table's shared entry for that identity.
///
/// Targets are shared, never copied: two objects referencing `7 0 R` both
/// observe the same Value instance, and self- or mutually-referencing
/// objects resolve to a finite cyclic graph. An object whose whole body is
/// a Reference becomes a Link itself.
///
/// The table is taken by value so that a failed resolution never exposes a
/// partially rewritten table.
///
/// @return The resolved table, or dangling_reference naming the first
///   identity that is referenced but absent.
auto resolve_table(ObjectTable table) -> Result<ObjectTable>;

/// Resolve the References inside a value that lives outside the table (the
/// trailer dictionary, for example) against an already resolved table.
auto resolve_value(Value& value, const ObjectTable& table) -> std::optional<Error>;

/// Look up an object by identity.
/// @return The shared entry, or dangling_reference if it is absent.
auto lookup(const ObjectTable& table, const ObjectId& id) -> Result<std::shared_ptr<Value>>;

/// Find a Reference placeholder that is still present anywhere in the
/// table. A resolved table never has one.
auto find_unresolved(const ObjectTable& table) -> std::optional<ObjectId>;

}  // namespace cos_cpp

/// @file types.hpp
/// @brief Core identity types: ObjectId, Prop, Bytes.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cos_cpp {

/// A raw byte sequence (string payloads, stream data, decoded output).
using Bytes = std::vector<std::byte>;

/// Identifies an indirect object: (object number, generation number).
///
/// Identities are unique within an object table. Ordering is by object
/// number first, then generation, which matches the order objects are
/// numbered in a file.
struct ObjectId {
    std::uint64_t number{0};      ///< The object number.
    std::uint64_t generation{0};  ///< The generation number.

    constexpr ObjectId() = default;

    /// Construct from an object number and generation.
    constexpr ObjectId(std::uint64_t n, std::uint64_t g) : number{n}, generation{g} {}

    auto operator<=>(const ObjectId&) const = default;
    auto operator==(const ObjectId&) const -> bool = default;

    /// Render as the reference spelling, e.g. "12 0 R".
    auto to_reference_string() const -> std::string {
        return std::to_string(number) + " " + std::to_string(generation) + " R";
    }
};

/// A key into a dictionary (string) or an index into an array (size_t).
using Prop = std::variant<std::string, std::size_t>;

/// Create a dictionary key Prop from a string.
inline auto dict_key(std::string key) -> Prop { return Prop{std::move(key)}; }

/// Create an array index Prop from an index.
inline auto array_index(std::size_t idx) -> Prop { return Prop{idx}; }

}  // namespace cos_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<cos_cpp::ObjectId> {
    auto operator()(const cos_cpp::ObjectId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.number);
        auto h2 = std::hash<std::uint64_t>{}(id.generation);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond

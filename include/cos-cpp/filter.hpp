/// @file filter.hpp
/// @brief Stream filters and the registry that maps filter names to them.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace cos_cpp {

/// A decoding filter: input bytes plus the filter's DecodeParms dictionary
/// (empty when none was given) to output bytes.
using FilterFn = std::function<Result<Bytes>(std::span<const std::byte> input,
                                             const Dictionary& params,
                                             const ParseLimits& limits)>;

/// Filters keyed by name (without the leading solidus).
///
/// @code
/// auto registry = cos_cpp::FilterRegistry::builtin();
/// registry.add("Identity", [](auto in, const auto&, const auto&) -> cos_cpp::Result<cos_cpp::Bytes> {
///     return cos_cpp::Bytes{in.begin(), in.end()};
/// });
/// auto bytes = stream.decode(registry);
/// @endcode
class FilterRegistry {
public:
    FilterRegistry() = default;

    /// A registry holding FlateDecode, ASCIIHexDecode and RunLengthDecode,
    /// under both their full and abbreviated names.
    static auto builtin() -> FilterRegistry;

    /// The process-wide built-in registry, initialized once.
    static auto default_registry() -> const FilterRegistry&;

    /// Register (or replace) a filter.
    void add(std::string name, FilterFn fn);

    /// Find a filter by name, or nullptr.
    auto find(std::string_view name) const -> const FilterFn*;

    auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

private:
    std::map<std::string, FilterFn, std::less<>> filters_;
};

/// Inflate zlib-wrapped DEFLATE data (the FlateDecode filter).
auto flate_decode(std::span<const std::byte> input, const ParseLimits& limits = {}) -> Result<Bytes>;

/// Decode ASCII hex data terminated by `>` (the ASCIIHexDecode filter).
auto ascii_hex_decode(std::span<const std::byte> input) -> Result<Bytes>;

/// Decode PackBits-style run-length data (the RunLengthDecode filter).
auto run_length_decode(std::span<const std::byte> input, const ParseLimits& limits = {}) -> Result<Bytes>;

}  // namespace cos_cpp

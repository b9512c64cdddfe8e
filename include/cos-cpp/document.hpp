/// @file document.hpp
/// @brief The Document class -- a parsed and fully resolved object graph.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/segmenter.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cos_cpp {

/// A document: every indirect object parsed and every reference resolved.
///
/// Loading is strictly two-phase. Every object is parsed independently
/// first, then references are resolved across the whole table. The first
/// error aborts construction; a partially built Document is never
/// returned. A loaded Document is immutable and safe to read from several
/// threads.
///
/// Values reached through a Document stay valid for as long as the
/// Document (or a copy of it) is alive.
///
/// @code
/// auto doc = cos_cpp::Document::load(file_bytes);
/// if (!doc) return;
/// auto pages = doc->get_path("Pages", "Kids", 0);
/// @endcode
class Document {
public:
    /// Split, parse and resolve a complete file.
    static auto load(std::span<const std::byte> data, const ParseLimits& limits = {})
        -> Result<Document>;

    /// Build a document from already framed parts.
    /// @param version The version string (e.g. "1.7").
    /// @param objects Object identities with their raw body bytes.
    /// @param trailer The raw trailer dictionary bytes.
    static auto from_parts(std::string version,
                           std::span<const RawObject> objects,
                           std::span<const std::byte> trailer,
                           const ParseLimits& limits = {}) -> Result<Document>;

    /// The version string from the header.
    auto version() const -> const std::string& { return version_; }

    /// The resolved trailer dictionary.
    auto trailer() const -> const Dictionary& { return trailer_; }

    /// The document catalog (`/Root` in the trailer), or nullptr if absent.
    auto root() const -> const Value*;

    /// Look up an indirect object. An object whose body is only a reference
    /// is followed to the value it names.
    /// @return The resolved value, or dangling_reference if it is absent or
    ///   its references loop without reaching a value.
    auto lookup(const ObjectId& id) const -> Result<const Value*>;

    /// The resolved object table.
    auto objects() const -> const ObjectTable& { return objects_; }

    /// Number of indirect objects.
    auto size() const -> std::size_t { return objects_.size(); }

    /// Walk a path of dictionary keys and array indices from root().
    /// @code
    /// auto first_page = doc.get_path("Pages", "Kids", 0);
    /// @endcode
    template <typename... Props>
        requires (sizeof...(Props) > 0)
    auto get_path(Props&&... props) const -> const Value*;

    /// Walk a path of Props from a starting value.
    static auto walk(const Value* from, std::span<const Prop> path) -> const Value*;

private:
    Document() = default;

    std::string version_;
    ObjectTable objects_;
    Dictionary trailer_;
};

// -- Template implementations (must be in header) ----------------------------

template <typename... Props>
    requires (sizeof...(Props) > 0)
auto Document::get_path(Props&&... props) const -> const Value* {
    auto path = std::vector<Prop>{};
    path.reserve(sizeof...(Props));
    auto to_prop = overload{
        [](std::string_view s) -> Prop { return std::string{s}; },
        [](const char* s) -> Prop { return std::string{s}; },
        [](const std::string& s) -> Prop { return s; },
        [](std::size_t i) -> Prop { return i; },
        [](int i) -> Prop { return static_cast<std::size_t>(i); },
    };
    (path.push_back(to_prop(std::forward<Props>(props))), ...);
    return walk(root(), path);
}

}  // namespace cos_cpp

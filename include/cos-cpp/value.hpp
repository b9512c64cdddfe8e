/// @file value.hpp
/// @brief The COS value model: Value and its cases Null, Name, String,
/// Array, Dictionary, Stream, Reference and Link.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/types.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cos_cpp {

class Value;
class FilterRegistry;

/// The `null` object.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// An atomic symbol such as `/Type`. The label holds the decoded bytes
/// without the leading solidus and with `#XX` escapes already applied.
struct Name {
    std::string label;  ///< Decoded name, e.g. "Lime Green" for `/Lime#20Green`.

    auto operator<=>(const Name&) const = default;
    auto operator==(const Name&) const -> bool = default;
};

/// Render a name label as UTF-8. A label that is already well-formed UTF-8
/// is returned unchanged; any other label is read as PDFDocEncoding.
auto label_to_utf8(std::string_view label) -> std::string;

/// Text encodings detectable from a string's byte order mark.
enum class TextEncoding : std::uint8_t {
    utf16be,  ///< Leading FE FF.
    utf8,     ///< Leading EF BB BF.
};

/// Convert a TextEncoding to its string representation.
constexpr auto to_string_view(TextEncoding encoding) noexcept -> std::string_view {
    switch (encoding) {
        case TextEncoding::utf16be: return "utf16be";
        case TextEncoding::utf8:    return "utf8";
    }
    return "unknown";
}

/// The surface syntax a string was written in.
enum class StringForm : std::uint8_t {
    literal,  ///< `(...)`
    hex,      ///< `<...>`
};

/// A byte string. Both surface forms normalize to raw bytes.
struct String {
    Bytes bytes;                           ///< Decoded bytes.
    std::optional<TextEncoding> encoding;  ///< Set when a BOM identifies the encoding.
    StringForm form{StringForm::literal};  ///< Surface form, kept for writing back.

    /// Build a string from raw bytes, detecting the encoding from its BOM.
    static auto from_bytes(Bytes bytes, StringForm form = StringForm::literal) -> String;

    /// Build a literal-form string from narrow characters.
    static auto from_string(std::string_view s) -> String;

    /// The raw bytes as a std::string (no transcoding).
    auto str() const -> std::string;

    /// The string as UTF-8 text.
    ///
    /// UTF-16BE and UTF-8 strings are transcoded per their BOM (the BOM is
    /// dropped); anything else is read as PDFDocEncoding. Ill-formed
    /// sequences in a UTF-8 string come out as U+FFFD.
    auto text() const -> std::string;

    /// Check whether the bytes plausibly represent text rather than binary.
    /// A UTF-8 string is text only when its payload is well-formed UTF-8.
    auto is_text() const -> bool;

    /// Strings compare by content only; the surface form is presentation.
    auto operator==(const String& other) const -> bool { return bytes == other.bytes; }
};

/// An ordered sequence of values.
struct Array {
    std::vector<Value> elements;

    Array() = default;
    explicit Array(std::vector<Value> e);

    auto size() const -> std::size_t;
    auto empty() const -> bool;

    auto operator==(const Array& other) const -> bool;
};

/// A mapping from name labels to values.
///
/// Keys are unique and iteration follows first-insertion order. Setting a
/// key that is already present replaces its value in place: for duplicate
/// keys in source text the last occurrence wins.
class Dictionary {
public:
    using Entry = std::pair<std::string, Value>;

    Dictionary() = default;

    /// Get the value stored under a key, or nullptr. Links are not followed.
    auto get(std::string_view key) const -> const Value*;

    /// Mutable access to the value stored under a key, or nullptr.
    auto find(std::string_view key) -> Value*;

    /// Insert or overwrite a key.
    void set(std::string key, Value value);

    /// Remove a key. Returns false if it was not present.
    auto erase(std::string_view key) -> bool;

    auto contains(std::string_view key) const -> bool { return get(key) != nullptr; }
    auto size() const -> std::size_t;
    auto empty() const -> bool;

    /// All keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    /// The entries in insertion order.
    auto entries() const -> const std::vector<Entry>& { return entries_; }

    auto begin() const;
    auto end() const;
    auto begin();
    auto end();

    auto operator==(const Dictionary& other) const -> bool;

private:
    std::vector<Entry> entries_;
};

/// A stream: a dictionary plus its undecoded payload bytes.
struct Stream {
    Dictionary dict;  ///< The stream dictionary (Length, Filter, DecodeParms, ...).
    Bytes data;       ///< The raw payload as it appeared in the file.

    /// Decode the payload through the declared filters using the built-in
    /// filter registry. With no `Filter` entry the raw payload is returned.
    auto decode() const -> Result<Bytes>;

    /// Decode the payload using a specific filter registry.
    auto decode(const FilterRegistry& registry, const ParseLimits& limits = {}) const -> Result<Bytes>;

    auto operator==(const Stream& other) const -> bool;
};

/// An unresolved pointer to an indirect object, as written `N G R`.
///
/// References exist only between parsing and resolution; the resolver
/// replaces every one of them with a Link.
struct Reference {
    ObjectId id;

    auto operator<=>(const Reference&) const = default;
    auto operator==(const Reference&) const -> bool = default;
};

/// A resolved reference: a non-owning handle to the shared value of an
/// indirect object.
///
/// Every Link to the same identity observes the same Value instance. The
/// object table owns the target, so Links never form ownership cycles.
struct Link {
    ObjectId id;                        ///< The identity that was referenced.
    std::weak_ptr<const Value> target;  ///< The table's shared entry for id.

    /// The target value, or nullptr if its owner has been destroyed.
    auto get() const -> const Value*;

    /// Links compare by identity only; comparing targets could recurse forever.
    auto operator==(const Link& other) const -> bool { return id == other.id; }
};

/// The table of indirect objects, keyed by identity.
using ObjectTable = std::map<ObjectId, std::shared_ptr<Value>>;

/// A COS value.
class Value {
public:
    /// The closed set of value cases.
    using Variant = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        Name,
        String,
        Array,
        Dictionary,
        Stream,
        Reference,
        Link
    >;

    /// Default-constructs to Null.
    Value() = default;

    template <typename T>
        requires std::constructible_from<Variant, T&&> &&
                 (!std::same_as<std::remove_cvref_t<T>, Value>)
    Value(T&& v) : data_{std::forward<T>(v)} {}

    // -- Type queries ---------------------------------------------------------

    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(data_); }

    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() -> T* { return std::get_if<T>(&data_); }

    auto is_null() const -> bool { return is<Null>(); }
    auto is_number() const -> bool { return is<std::int64_t>() || is<double>(); }

    /// The case name, e.g. "dictionary".
    auto type_name() const -> std::string_view;

    auto data() const -> const Variant& { return data_; }
    auto data() -> Variant& { return data_; }

    // -- Navigation (follows Links) -------------------------------------------

    /// Follow Links until a non-Link value is reached.
    /// @return this for non-Link values; nullptr if a target has expired or
    ///   the Links form a loop with no concrete value.
    auto deref() const -> const Value*;

    /// Dictionary (or stream dictionary) lookup, following Links on both
    /// sides. @return nullptr if this is not a dictionary or the key is absent.
    auto get(std::string_view key) const -> const Value*;

    /// Array element access, following Links on both sides.
    /// @return nullptr if this is not an array or the index is out of range.
    auto at(std::size_t index) const -> const Value*;

    /// The numeric value as a double, for either number case.
    auto as_number() const -> std::optional<double>;

    // -- Children / placeholder replacement -----------------------------------

    /// Visit each immediate child. Primitives, References and Links have
    /// none; a Stream's children are its dictionary's values.
    void for_each_child(const std::function<void(const Value&)>& fn) const;

    /// Collect the immediate children.
    auto children() const -> std::vector<const Value*>;

    /// Replace every direct Reference child with a Link to its entry in
    /// `table`, and recurse into non-Reference composite children.
    /// @return dangling_reference naming the first identity absent from the table.
    auto replace_references(const ObjectTable& table) -> std::optional<Error>;

    auto operator==(const Value& other) const -> bool;

private:
    Variant data_;
};

// -- Container members that need a complete Value ----------------------------

inline auto Array::size() const -> std::size_t { return elements.size(); }
inline auto Array::empty() const -> bool { return elements.empty(); }

inline auto Dictionary::size() const -> std::size_t { return entries_.size(); }
inline auto Dictionary::empty() const -> bool { return entries_.empty(); }
inline auto Dictionary::begin() const { return entries_.begin(); }
inline auto Dictionary::end() const { return entries_.end(); }
inline auto Dictionary::begin() { return entries_.begin(); }
inline auto Dictionary::end() { return entries_.end(); }

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Name& n) { std::printf("/%s\n", n.label.c_str()); },
///     [](auto&&) { std::printf("other\n"); },
/// }, value.data());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed copy from a (possibly null) value pointer, following Links.
/// @code
/// auto count = get_as<std::int64_t>(doc.root()->get("Count"));
/// @endcode
template <typename T>
auto get_as(const Value* v) -> std::optional<T> {
    if (v == nullptr) return std::nullopt;
    const auto* target = v->deref();
    if (target == nullptr) return std::nullopt;
    if (const auto* t = target->get_if<T>()) {
        return *t;
    }
    return std::nullopt;
}

/// Convenience constructor for a Name value.
inline auto make_name(std::string label) -> Value { return Value{Name{std::move(label)}}; }

}  // namespace cos_cpp

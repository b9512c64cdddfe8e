#include <cos-cpp/value.hpp>

#include <algorithm>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cos_cpp {

// -- String -------------------------------------------------------------------

auto String::from_bytes(Bytes bytes, StringForm form) -> String {
    auto s = String{};
    if (bytes.size() >= 2 && bytes[0] == std::byte{0xFE} && bytes[1] == std::byte{0xFF}) {
        s.encoding = TextEncoding::utf16be;
    } else if (bytes.size() >= 3 && bytes[0] == std::byte{0xEF} &&
               bytes[1] == std::byte{0xBB} && bytes[2] == std::byte{0xBF}) {
        s.encoding = TextEncoding::utf8;
    }
    s.bytes = std::move(bytes);
    s.form = form;
    return s;
}

auto String::from_string(std::string_view text) -> String {
    auto bytes = Bytes(text.size());
    std::transform(text.begin(), text.end(), bytes.begin(),
        [](char c) { return static_cast<std::byte>(c); });
    return from_bytes(std::move(bytes), StringForm::literal);
}

auto String::str() const -> std::string {
    return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// -- Array / Dictionary / Stream ----------------------------------------------

Array::Array(std::vector<Value> e) : elements{std::move(e)} {}

auto Array::operator==(const Array& other) const -> bool {
    return elements == other.elements;
}

auto Dictionary::get(std::string_view key) const -> const Value* {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

auto Dictionary::find(std::string_view key) -> Value* {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

void Dictionary::set(std::string key, Value value) {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

auto Dictionary::erase(std::string_view key) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

auto Dictionary::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [k, v] : entries_) result.push_back(k);
    return result;
}

// Key order is presentation only.
auto Dictionary::operator==(const Dictionary& other) const -> bool {
    if (entries_.size() != other.entries_.size()) return false;
    return std::all_of(entries_.begin(), entries_.end(), [&](const Entry& e) {
        const auto* v = other.get(e.first);
        return v != nullptr && *v == e.second;
    });
}

auto Stream::operator==(const Stream& other) const -> bool {
    return dict == other.dict && data == other.data;
}

// -- Link ---------------------------------------------------------------------

auto Link::get() const -> const Value* {
    auto locked = target.lock();
    // The owner keeps the target alive; the temporary shared_ptr only
    // confirms that it still exists.
    return locked.get();
}

// -- Value --------------------------------------------------------------------

auto Value::type_name() const -> std::string_view {
    return std::visit(overload{
        [](const Null&) -> std::string_view { return "null"; },
        [](bool) -> std::string_view { return "boolean"; },
        [](std::int64_t) -> std::string_view { return "integer"; },
        [](double) -> std::string_view { return "real"; },
        [](const Name&) -> std::string_view { return "name"; },
        [](const String&) -> std::string_view { return "string"; },
        [](const Array&) -> std::string_view { return "array"; },
        [](const Dictionary&) -> std::string_view { return "dictionary"; },
        [](const Stream&) -> std::string_view { return "stream"; },
        [](const Reference&) -> std::string_view { return "reference"; },
        [](const Link&) -> std::string_view { return "link"; },
    }, data_);
}

auto Value::deref() const -> const Value* {
    // A chain longer than this can only be a loop of Link-only objects.
    constexpr auto max_hops = 64;
    const auto* current = this;
    for (auto hop = 0; hop < max_hops; ++hop) {
        const auto* link = current->get_if<Link>();
        if (link == nullptr) return current;
        current = link->get();
        if (current == nullptr) return nullptr;
    }
    return nullptr;
}

auto Value::get(std::string_view key) const -> const Value* {
    const auto* self = deref();
    if (self == nullptr) return nullptr;
    const Value* found = nullptr;
    if (const auto* dict = self->get_if<Dictionary>()) {
        found = dict->get(key);
    } else if (const auto* stream = self->get_if<Stream>()) {
        found = stream->dict.get(key);
    }
    return found == nullptr ? nullptr : found->deref();
}

auto Value::at(std::size_t index) const -> const Value* {
    const auto* self = deref();
    if (self == nullptr) return nullptr;
    const auto* array = self->get_if<Array>();
    if (array == nullptr || index >= array->elements.size()) return nullptr;
    return array->elements[index].deref();
}

auto Value::as_number() const -> std::optional<double> {
    const auto* self = deref();
    if (self == nullptr) return std::nullopt;
    if (const auto* i = self->get_if<std::int64_t>()) return static_cast<double>(*i);
    if (const auto* d = self->get_if<double>()) return *d;
    return std::nullopt;
}

void Value::for_each_child(const std::function<void(const Value&)>& fn) const {
    std::visit(overload{
        [&](const Array& a) {
            for (const auto& e : a.elements) fn(e);
        },
        [&](const Dictionary& d) {
            for (const auto& [k, v] : d.entries()) fn(v);
        },
        [&](const Stream& s) {
            for (const auto& [k, v] : s.dict.entries()) fn(v);
        },
        [](const auto&) {},
    }, data_);
}

auto Value::children() const -> std::vector<const Value*> {
    auto result = std::vector<const Value*>{};
    for_each_child([&](const Value& child) { result.push_back(&child); });
    return result;
}

namespace {

// Resolve one child slot: a Reference becomes a Link to the table entry,
// anything else is recursed into.
auto replace_slot(Value& slot, const ObjectTable& table) -> std::optional<Error> {
    if (const auto* ref = slot.get_if<Reference>()) {
        auto it = table.find(ref->id);
        if (it == table.end()) {
            return Error{ErrorKind::dangling_reference,
                         "reference to missing object " + ref->id.to_reference_string()};
        }
        auto id = ref->id;
        slot = Value{Link{id, it->second}};
        return std::nullopt;
    }
    return slot.replace_references(table);
}

}  // anonymous namespace

auto Value::replace_references(const ObjectTable& table) -> std::optional<Error> {
    return std::visit(overload{
        [&](Array& a) -> std::optional<Error> {
            for (auto& e : a.elements) {
                if (auto err = replace_slot(e, table)) return err;
            }
            return std::nullopt;
        },
        [&](Dictionary& d) -> std::optional<Error> {
            for (auto& [k, v] : d) {
                if (auto err = replace_slot(v, table)) return err;
            }
            return std::nullopt;
        },
        [&](Stream& s) -> std::optional<Error> {
            for (auto& [k, v] : s.dict) {
                if (auto err = replace_slot(v, table)) return err;
            }
            return std::nullopt;
        },
        // Leaves, References and Links: nothing below them to rewrite.
        [](auto&) -> std::optional<Error> { return std::nullopt; },
    }, data_);
}

auto Value::operator==(const Value& other) const -> bool {
    return data_ == other.data_;
}

}  // namespace cos_cpp

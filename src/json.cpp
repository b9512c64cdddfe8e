#include <cos-cpp/json.hpp>

#include <charconv>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace cos_cpp {

namespace {

auto bytes_to_hex(const Bytes& bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        auto c = static_cast<unsigned char>(b);
        result.push_back(hex_chars[c >> 4]);
        result.push_back(hex_chars[c & 0x0F]);
    }
    return result;
}

// "N G", the key objects are listed under in a document export.
auto object_key(const ObjectId& id) -> std::string {
    return std::to_string(id.number) + " " + std::to_string(id.generation);
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ObjectId& id) {
    j = nlohmann::json{{"number", id.number}, {"generation", id.generation}};
}

void to_json(nlohmann::json& j, const Name& n) {
    j = nlohmann::json{{"/", label_to_utf8(n.label)}};
}

void to_json(nlohmann::json& j, const String& s) {
    if (s.is_text()) {
        j = s.text();
    } else {
        j = nlohmann::json{{"hex", bytes_to_hex(s.bytes)}};
    }
}

void to_json(nlohmann::json& j, const Array& a) {
    j = nlohmann::json::array();
    for (const auto& element : a.elements) {
        auto element_j = nlohmann::json{};
        to_json(element_j, element);
        j.push_back(std::move(element_j));
    }
}

void to_json(nlohmann::json& j, const Dictionary& d) {
    j = nlohmann::json::object();
    for (const auto& [key, value] : d) {
        auto value_j = nlohmann::json{};
        to_json(value_j, value);
        j[label_to_utf8(key)] = std::move(value_j);
    }
}

void to_json(nlohmann::json& j, const Stream& s) {
    auto dict_j = nlohmann::json{};
    to_json(dict_j, s.dict);
    j = nlohmann::json{{"dict", std::move(dict_j)}, {"length", s.data.size()}};
}

void to_json(nlohmann::json& j, const Reference& r) {
    j = nlohmann::json{{"ref", r.id.to_reference_string()}, {"resolved", false}};
}

void to_json(nlohmann::json& j, const Link& l) {
    j = nlohmann::json{{"ref", l.id.to_reference_string()}};
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const Name& n) { to_json(j, n); },
        [&](const String& s) { to_json(j, s); },
        [&](const Array& a) { to_json(j, a); },
        [&](const Dictionary& d) { to_json(j, d); },
        [&](const Stream& s) { to_json(j, s); },
        [&](const Reference& r) { to_json(j, r); },
        [&](const Link& l) { to_json(j, l); },
    }, v.data());
}

// =============================================================================
// Document export
// =============================================================================

auto export_json(const Document& doc) -> nlohmann::json {
    auto trailer_j = nlohmann::json{};
    to_json(trailer_j, doc.trailer());

    auto objects_j = nlohmann::json::object();
    for (const auto& [id, object] : doc.objects()) {
        auto object_j = nlohmann::json{};
        to_json(object_j, *object);
        objects_j[object_key(id)] = std::move(object_j);
    }

    return nlohmann::json{
        {"version", label_to_utf8(doc.version())},
        {"trailer", std::move(trailer_j)},
        {"objects", std::move(objects_j)},
    };
}

// =============================================================================
// JSON Pointer (RFC 6901)
// =============================================================================

namespace {

/// Parse an RFC 6901 JSON Pointer into segments.
/// Empty string "" = the trailer (0 segments).
/// "/" = one empty-string segment.
/// "/Root/Pages/Kids/0" = ["Root", "Pages", "Kids", "0"].
auto parse_pointer(std::string_view pointer) -> std::vector<std::string> {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw std::runtime_error{"JSON Pointer must start with '/' or be empty"};
    }
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (pos <= pointer.size()) {
        auto next = pointer.find('/', pos);
        auto segment = std::string{pointer.substr(pos, next - pos)};
        // Unescape: ~1 -> /, ~0 -> ~
        for (auto i = std::size_t{0}; i < segment.size(); ++i) {
            if (segment[i] == '~' && i + 1 < segment.size()) {
                if (segment[i + 1] == '1') {
                    segment.replace(i, 2, "/");
                } else if (segment[i + 1] == '0') {
                    segment.replace(i, 2, "~");
                }
            }
        }
        segments.push_back(std::move(segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

/// Try to parse a segment as an array index.
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // anonymous namespace

auto get_pointer(const Document& doc, std::string_view pointer) -> const Value* {
    auto segments = parse_pointer(pointer);
    if (segments.empty()) return nullptr;

    const auto* current = doc.trailer().get(segments.front());
    if (current != nullptr) current = current->deref();
    for (std::size_t i = 1; i < segments.size() && current != nullptr; ++i) {
        if (current->is<Array>()) {
            auto idx = try_parse_index(segments[i]);
            if (!idx) return nullptr;
            current = current->at(*idx);
        } else {
            current = current->get(segments[i]);
        }
    }
    return current;
}

}  // namespace cos_cpp

#include <cos-cpp/document.hpp>
#include <cos-cpp/parser.hpp>
#include <cos-cpp/resolver.hpp>

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace cos_cpp {

namespace {

auto object_label(const ObjectId& id) -> std::string {
    return "object " + std::to_string(id.number) + " " + std::to_string(id.generation);
}

// Keep the kind, add where the error happened.
auto in_context(const Error& error, const std::string& where) -> Error {
    return Error{error.kind, where + ": " + error.message};
}

}  // anonymous namespace

auto Document::load(std::span<const std::byte> data, const ParseLimits& limits)
    -> Result<Document> {
    auto segments = segment_file(data, limits);
    if (!segments) return segments.error();
    return from_parts(std::move(segments->version), segments->objects, segments->trailer, limits);
}

auto Document::from_parts(std::string version,
                          std::span<const RawObject> objects,
                          std::span<const std::byte> trailer,
                          const ParseLimits& limits) -> Result<Document> {
    if (objects.size() > limits.max_objects) {
        return Error{ErrorKind::invalid_document,
                     "more than " + std::to_string(limits.max_objects) + " objects"};
    }

    // Phase 1: every object is parsed on its own.
    auto table = ObjectTable{};
    for (const auto& raw : objects) {
        auto value = parse_object(raw.content, limits);
        if (!value) return in_context(value.error(), object_label(raw.id));
        auto [it, inserted] = table.emplace(raw.id, std::make_shared<Value>(std::move(*value)));
        if (!inserted) {
            return Error{ErrorKind::invalid_document, "duplicate " + object_label(raw.id)};
        }
    }

    // Phase 2: references are resolved across the complete table.
    auto resolved = resolve_table(std::move(table));
    if (!resolved) return resolved.error();

    auto trailer_value = parse_object(trailer, limits);
    if (!trailer_value) return in_context(trailer_value.error(), "trailer");
    if (!trailer_value->is<Dictionary>()) {
        return Error{ErrorKind::invalid_document,
                     "trailer is a " + std::string{trailer_value->type_name()} + ", not a dictionary"};
    }
    if (auto err = resolve_value(*trailer_value, *resolved)) return in_context(*err, "trailer");

    auto doc = Document{};
    doc.version_ = std::move(version);
    doc.objects_ = std::move(*resolved);
    doc.trailer_ = std::move(*trailer_value->get_if<Dictionary>());
    return doc;
}

auto Document::root() const -> const Value* {
    const auto* root = trailer_.get("Root");
    return root == nullptr ? nullptr : root->deref();
}

auto Document::lookup(const ObjectId& id) const -> Result<const Value*> {
    auto object = cos_cpp::lookup(objects_, id);
    if (!object) return object.error();
    const auto* value = (*object)->deref();
    if (value == nullptr) {
        return Error{ErrorKind::dangling_reference,
                     "object " + id.to_reference_string() + " leads to a reference loop"};
    }
    return value;
}

auto Document::walk(const Value* from, std::span<const Prop> path) -> const Value* {
    const auto* current = from == nullptr ? nullptr : from->deref();
    for (const auto& prop : path) {
        if (current == nullptr) return nullptr;
        current = std::visit(overload{
            [&](const std::string& key) { return current->get(key); },
            [&](std::size_t index) { return current->at(index); },
        }, prop);
    }
    return current;
}

}  // namespace cos_cpp

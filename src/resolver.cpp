#include <cos-cpp/resolver.hpp>

#include <functional>
#include <optional>
#include <utility>

namespace cos_cpp {

namespace {

auto dangling(const ObjectId& id) -> Error {
    return Error{ErrorKind::dangling_reference,
                 "reference to missing object " + id.to_reference_string()};
}

}  // anonymous namespace

auto resolve_value(Value& value, const ObjectTable& table) -> std::optional<Error> {
    if (const auto* ref = value.get_if<Reference>()) {
        // The slot itself holds a reference: it becomes the Link.
        auto it = table.find(ref->id);
        if (it == table.end()) return dangling(ref->id);
        auto target_id = ref->id;
        value = Value{Link{target_id, it->second}};
        return std::nullopt;
    }
    return value.replace_references(table);
}

auto resolve_table(ObjectTable table) -> Result<ObjectTable> {
    // Each object only rewrites its own descendants and reads the table's
    // shared entries, so the order objects are visited in does not matter.
    for (auto& [id, object] : table) {
        if (auto err = resolve_value(*object, table)) return *err;
    }
    return table;
}

auto lookup(const ObjectTable& table, const ObjectId& id) -> Result<std::shared_ptr<Value>> {
    auto it = table.find(id);
    if (it == table.end()) return dangling(id);
    return it->second;
}

auto find_unresolved(const ObjectTable& table) -> std::optional<ObjectId> {
    // Walks owned subtrees only; Links are handles, not children, so a
    // cyclic graph is still visited finitely.
    auto search = std::function<std::optional<ObjectId>(const Value&)>{};
    search = [&](const Value& v) -> std::optional<ObjectId> {
        if (const auto* ref = v.get_if<Reference>()) return ref->id;
        auto found = std::optional<ObjectId>{};
        v.for_each_child([&](const Value& child) {
            if (!found) found = search(child);
        });
        return found;
    };
    for (const auto& [id, object] : table) {
        if (auto found = search(*object)) return found;
    }
    return std::nullopt;
}

}  // namespace cos_cpp

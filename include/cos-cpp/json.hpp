/// @file json.hpp
/// @brief nlohmann/json interoperability for cos-cpp.
///
/// Provides ADL serialization (to_json), whole-document export, and
/// JSON Pointer (RFC 6901) navigation over a resolved document.

#pragma once

#include <cos-cpp/document.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace cos_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

void to_json(nlohmann::json& j, Null);
/// `{"number": N, "generation": G}`.
void to_json(nlohmann::json& j, const ObjectId& id);
void to_json(nlohmann::json& j, const Name& n);
void to_json(nlohmann::json& j, const String& s);
void to_json(nlohmann::json& j, const Array& a);
void to_json(nlohmann::json& j, const Dictionary& d);
void to_json(nlohmann::json& j, const Stream& s);
void to_json(nlohmann::json& j, const Reference& r);
void to_json(nlohmann::json& j, const Link& l);

/// Convert any value. Links become `{"ref": "N G R"}` and are never
/// expanded, so cyclic graphs export finitely.
void to_json(nlohmann::json& j, const Value& v);

// =============================================================================
// Document export
// =============================================================================

/// Export a whole document:
/// `{"version": ..., "trailer": {...}, "objects": {"N G": value, ...}}`.
auto export_json(const Document& doc) -> nlohmann::json;

// =============================================================================
// JSON Pointer (RFC 6901)
// =============================================================================

/// Get the value at a JSON Pointer path, starting from the trailer and
/// following Links (e.g. "/Root/Pages/Kids/0").
/// @return The value, or nullptr if the path doesn't exist. The empty
///   pointer names the trailer itself, which is not a Value: nullptr.
/// @throws std::runtime_error if the pointer is not empty and does not
///   start with '/'.
auto get_pointer(const Document& doc, std::string_view pointer) -> const Value*;

}  // namespace cos_cpp

/// @file json.hpp
/// @brief nlohmann/json interoperability for docmerge-cpp.
///
/// Provides ADL serialization (to_json/from_json) for identifiers and
/// scalars, validated ingestion of JSON-shaped patch trees, and export
/// of materialized documents and their conflict history.

#pragma once

#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/patch.hpp>
#include <docmerge-cpp/types.hpp>
#include <docmerge-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace docmerge_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Counter& c);

/// Scalars map naturally; a Counter becomes {"datatype": "counter", "value": n}.
void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

/// OpIds are encoded as "<counter>@<actor>".
void to_json(nlohmann::json& j, const OpId& id);
void from_json(const nlohmann::json& j, OpId& id);

// =============================================================================
// Patch ingestion
// =============================================================================

/// Parse and validate a JSON patch tree.
///
/// The JSON shape is
/// @code
/// {"type": "map" | "list", "objectId": "...",
///  "props": {"<key or index>": {"<counter>@<actor>": <sub-patch>, ...}},
///  "edits": [{"action": "insert", "index": 0, "elemId": "1@A"},
///            {"action": "remove", "index": 0}]}
/// @endcode
/// where a sub-patch is either a nested patch (it carries "objectId")
/// or a leaf {"value": v} / {"value": n, "datatype": "counter"}.
/// A top-level patch may omit "objectId".
///
/// @throws Exception with ErrorKind::unknown_patch_type if "type" is
///   neither "map" nor "list", ErrorKind::malformed_identifier for a bad
///   OpId, and ErrorKind::invalid_patch for any other structural error.
auto parse_patch(const nlohmann::json& j) -> ObjectPatch;

// =============================================================================
// Document export
// =============================================================================

/// Export a materialized value as plain JSON.
///
/// Maps become JSON objects, lists become JSON arrays, counters become
/// plain numbers and unset list slots become null.
auto export_json(const Value& value) -> nlohmann::json;

/// Export the conflict history of a map: {"key": {"<opid>": value, ...}}.
auto export_conflicts(const Map& map) -> nlohmann::json;

/// Export the conflict history of a list: one entry per position, null
/// where the slot is unset.
auto export_conflicts(const List& list) -> nlohmann::json;

}  // namespace docmerge_cpp

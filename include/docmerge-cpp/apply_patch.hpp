/// @file apply_patch.hpp
/// @brief Applying patch trees to document containers.

#pragma once

#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/patch.hpp>
#include <docmerge-cpp/value.hpp>

#include <optional>

namespace docmerge_cpp {

/// Apply a map patch to a map in place.
///
/// The map is unfrozen for the duration of the call and frozen again on
/// every exit path. Each slot in patch.props is merged as a multi-value
/// register: the Lamport-greatest candidate becomes the visible value,
/// and the whole candidate set replaces the slot's history. Nested
/// container patches whose object id matches the existing container are
/// merged into it in place.
///
/// @throws Exception on an ill-formed patch. The map may be partially
///   updated, but is always frozen again.
void apply_patch(Map& map, const MapPatch& patch);

/// Apply a list patch to a list in place.
///
/// Structural edits run first, keeping values, element ids and history
/// in lock-step; props are merged afterwards against the post-edit
/// positions.
void apply_patch(List& list, const ListPatch& patch);

/// Apply a patch to an existing object, or to a fresh one.
///
/// When object is nullopt a new container of the patch's type and
/// object id is created. The returned Value holds the same container
/// that was passed in.
///
/// @throws Exception with ErrorKind::type_mismatch if object is a scalar
///   or a container of the other type.
auto apply_patch(std::optional<Value> object, const ObjectPatch& patch) -> Value;

}  // namespace docmerge_cpp

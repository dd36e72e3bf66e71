/// @file patch.hpp
/// @brief Patch tree types describing remote changes to one container.

#pragma once

#include <docmerge-cpp/types.hpp>
#include <docmerge-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docmerge_cpp {

/// A leaf of the patch tree: a primitive or counter value.
struct ValuePatch {
    ScalarValue value;  ///< A Counter when the patch carried a datatype tag.
    auto operator==(const ValuePatch&) const -> bool = default;
};

struct ObjectPatch;

/// What one operation wrote into a slot: a leaf or a nested container patch.
using SubPatch = std::variant<ValuePatch, std::shared_ptr<const ObjectPatch>>;

/// The conflict set of one slot: every concurrent candidate, keyed by the
/// operation that wrote it. An empty set deletes the slot.
using PatchConflicts = std::map<OpId, SubPatch>;

/// A change to a map container.
struct MapPatch {
    ObjectId object_id;                                          ///< Target identity.
    std::optional<std::map<std::string, PatchConflicts>> props;  ///< Slot updates.
};

/// The kind of structural list edit.
enum class EditAction : std::uint8_t {
    insert,  ///< Insert an unset slot.
    remove,  ///< Remove a slot.
};

/// Convert an EditAction to its string representation.
constexpr auto to_string_view(EditAction action) noexcept -> std::string_view {
    switch (action) {
        case EditAction::insert: return "insert";
        case EditAction::remove: return "remove";
    }
    return "unknown";
}

/// A positional insert or remove in a list.
struct ListEdit {
    EditAction action;
    std::size_t index;
    std::optional<OpId> elem_id{};  ///< Required for insert.

    auto operator==(const ListEdit&) const -> bool = default;
};

/// A change to a list container. Edits are applied before props.
struct ListPatch {
    ObjectId object_id;                                          ///< Target identity.
    std::optional<std::vector<ListEdit>> edits;                  ///< Structural edits.
    std::optional<std::map<std::size_t, PatchConflicts>> props;  ///< Slot updates.
};

/// A change to one container: either a map patch or a list patch.
struct ObjectPatch {
    std::variant<MapPatch, ListPatch> inner;

    ObjectPatch(MapPatch p) : inner{std::move(p)} {}
    ObjectPatch(ListPatch p) : inner{std::move(p)} {}

    auto type() const -> ObjType {
        return std::holds_alternative<MapPatch>(inner) ? ObjType::map : ObjType::list;
    }

    auto object_id() const -> const ObjectId& {
        return std::visit([](const auto& p) -> const ObjectId& { return p.object_id; },
                          inner);
    }
};

/// Wrap a container patch as a nested sub-patch.
inline auto make_sub_patch(ObjectPatch patch) -> SubPatch {
    return SubPatch{std::make_shared<const ObjectPatch>(std::move(patch))};
}

/// Wrap a scalar as a leaf sub-patch.
inline auto make_sub_patch(ScalarValue value) -> SubPatch {
    return SubPatch{ValuePatch{std::move(value)}};
}

}  // namespace docmerge_cpp

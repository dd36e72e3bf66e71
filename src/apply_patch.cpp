#include <docmerge-cpp/apply_patch.hpp>
#include <docmerge-cpp/error.hpp>

#include "apply_state.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <utility>

namespace docmerge_cpp {

namespace detail {

auto lamport_order_descending(const PatchConflicts& candidates) -> std::vector<OpId> {
    auto ids = std::vector<OpId>{};
    ids.reserve(candidates.size());
    for (const auto& [id, _] : candidates) {
        ids.push_back(id);
    }
    std::ranges::sort(ids, [](const OpId& a, const OpId& b) {
        return lamport_compare(a, b) > 0;
    });
    return ids;
}

namespace {

// A differing object id means the remote side replaced the whole subtree
// with a newly created container, so the old one is not reused.
auto materialize_object(const Value* existing, const ObjectPatch& patch) -> Value {
    return std::visit(overload{
        [&](const MapPatch& p) -> Value {
            auto map = existing ? get_map(*existing) : nullptr;
            if (!map || map->object_id() != p.object_id) {
                map = std::make_shared<Map>(p.object_id);
            }
            apply_patch(*map, p);
            return map;
        },
        [&](const ListPatch& p) -> Value {
            auto list = existing ? get_list(*existing) : nullptr;
            if (!list || list->object_id() != p.object_id) {
                list = std::make_shared<List>(p.object_id);
            }
            apply_patch(*list, p);
            return list;
        },
    }, patch.inner);
}

}  // anonymous namespace

auto materialize(const Value* existing, const SubPatch& sub) -> Value {
    return std::visit(overload{
        [](const ValuePatch& leaf) -> Value { return leaf.value; },
        [&](const std::shared_ptr<const ObjectPatch>& nested) -> Value {
            if (!nested) {
                throw Exception{ErrorKind::invalid_patch, "null nested object patch"};
            }
            return materialize_object(existing, *nested);
        },
    }, sub);
}

auto merge_candidates(const Conflicts* existing, const PatchConflicts& candidates)
    -> MergedSlot {
    const auto ids = lamport_order_descending(candidates);

    auto history = Conflicts{};
    for (const auto& id : ids) {
        const Value* previous = nullptr;
        if (existing) {
            if (auto it = existing->find(id); it != existing->end()) {
                previous = &it->second;
            }
        }
        history.emplace(id, materialize(previous, candidates.at(id)));
    }

    auto winner = history.at(ids.front());
    return MergedSlot{.winner = std::move(winner), .history = std::move(history)};
}

void merge_properties(Map& map, const std::map<std::string, PatchConflicts>& props) {
    for (const auto& [key, candidates] : props) {
        if (candidates.empty()) {
            // an empty conflict set signals "delete"
            map.erase(key);
            continue;
        }
        auto slot = merge_candidates(map.conflicts(key), candidates);
        map.put(key, std::move(slot.winner), std::move(slot.history));
    }
}

void merge_properties(List& list, const std::map<std::size_t, PatchConflicts>& props) {
    for (const auto& [index, candidates] : props) {
        if (index >= list.size()) {
            throw Exception{ErrorKind::invalid_patch,
                fmt::format("props index {} out of range for list {} of size {}",
                            index, list.object_id(), list.size())};
        }
        // Structural removal comes only from edits; an empty set clears
        // the slot but keeps its position and element id.
        if (candidates.empty()) {
            list.unset(index);
            continue;
        }
        auto slot = merge_candidates(list.conflicts(index), candidates);
        list.put(index, std::move(slot.winner), std::move(slot.history));
    }
}

void apply_edits(List& list, const std::vector<ListEdit>& edits) {
    for (const auto& edit : edits) {
        switch (edit.action) {
            case EditAction::insert:
                if (!edit.elem_id) {
                    throw Exception{ErrorKind::invalid_patch,
                        fmt::format("insert at {} in list {} has no elemId",
                                    edit.index, list.object_id())};
                }
                if (edit.index > list.size()) {
                    throw Exception{ErrorKind::invalid_patch,
                        fmt::format("insert index {} out of range for list {} of size {}",
                                    edit.index, list.object_id(), list.size())};
                }
                list.insert(edit.index, *edit.elem_id);
                break;
            case EditAction::remove:
                if (edit.index >= list.size()) {
                    throw Exception{ErrorKind::invalid_patch,
                        fmt::format("remove index {} out of range for list {} of size {}",
                                    edit.index, list.object_id(), list.size())};
                }
                list.remove(edit.index);
                break;
        }
    }
}

}  // namespace detail

// =============================================================================
// Patch dispatch
// =============================================================================

void apply_patch(Map& map, const MapPatch& patch) {
    auto guard = detail::FrozenGuard{map};
    // A patch without props only confirms the shape of the object.
    if (!patch.props) return;
    detail::merge_properties(map, *patch.props);
}

void apply_patch(List& list, const ListPatch& patch) {
    auto guard = detail::FrozenGuard{list};
    if (!patch.props && !patch.edits) return;
    if (patch.edits) detail::apply_edits(list, *patch.edits);
    if (patch.props) detail::merge_properties(list, *patch.props);
}

auto apply_patch(std::optional<Value> object, const ObjectPatch& patch) -> Value {
    return std::visit(overload{
        [&](const MapPatch& p) -> Value {
            auto map = object ? get_map(*object) : std::make_shared<Map>(p.object_id);
            if (!map) {
                throw Exception{ErrorKind::type_mismatch,
                    fmt::format("map patch for {} applied to a non-map value", p.object_id)};
            }
            apply_patch(*map, p);
            return map;
        },
        [&](const ListPatch& p) -> Value {
            auto list = object ? get_list(*object) : std::make_shared<List>(p.object_id);
            if (!list) {
                throw Exception{ErrorKind::type_mismatch,
                    fmt::format("list patch for {} applied to a non-list value", p.object_id)};
            }
            apply_patch(*list, p);
            return list;
        },
    }, patch.inner);
}

}  // namespace docmerge_cpp

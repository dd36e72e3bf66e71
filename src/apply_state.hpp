#pragma once

// Internal header, not installed. Implementation detail of apply_patch.

#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/patch.hpp>
#include <docmerge-cpp/value.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace docmerge_cpp::detail {

// Opens the mutation guard of one container for the lifetime of the
// guard object and restores the previous state on every exit path.
class FrozenGuard {
public:
    explicit FrozenGuard(Map& map) : flag_{map.frozen_}, previous_{map.frozen_} {
        flag_ = false;
    }

    explicit FrozenGuard(List& list) : flag_{list.frozen_}, previous_{list.frozen_} {
        flag_ = false;
    }

    ~FrozenGuard() { flag_ = previous_; }

    FrozenGuard(const FrozenGuard&) = delete;
    auto operator=(const FrozenGuard&) -> FrozenGuard& = delete;
    FrozenGuard(FrozenGuard&&) = delete;
    auto operator=(FrozenGuard&&) -> FrozenGuard& = delete;

private:
    bool& flag_;
    bool previous_;
};

// The visible value of a slot plus the candidate set it was chosen from.
struct MergedSlot {
    Value winner;
    Conflicts history;
};

// The OpIds of a conflict set, Lamport-greatest first.
auto lamport_order_descending(const PatchConflicts& candidates) -> std::vector<OpId>;

// Turn one sub-patch into a document value. existing is the value this
// same operation produced last time (or nullptr); a container is reused
// in place when its type and object id match the sub-patch.
auto materialize(const Value* existing, const SubPatch& sub) -> Value;

// Materialize every candidate of one slot. candidates must not be empty.
auto merge_candidates(const Conflicts* existing, const PatchConflicts& candidates)
    -> MergedSlot;

void merge_properties(Map& map, const std::map<std::string, PatchConflicts>& props);
void merge_properties(List& list, const std::map<std::size_t, PatchConflicts>& props);

// Insert/remove edits, applied to values, elem ids and history together.
void apply_edits(List& list, const std::vector<ListEdit>& edits);

}  // namespace docmerge_cpp::detail

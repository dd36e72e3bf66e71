/// @file document.hpp
/// @brief The document containers: Map and List.

#pragma once

#include <docmerge-cpp/types.hpp>
#include <docmerge-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docmerge_cpp {

namespace detail {
class FrozenGuard;
}  // namespace detail

/// A keyed container in the document tree.
///
/// Besides the visible key -> value mapping, a Map remembers every
/// concurrently written candidate for each key (recent_ops), so that a
/// later patch may update one candidate without resending the others.
///
/// A Map is frozen whenever no apply_patch call is running on it.
/// Mutating a frozen Map throws ErrorKind::frozen_object.
///
/// @code
/// auto doc = std::make_shared<Map>("_root");
/// apply_patch(*doc, patch);
/// auto x = get_scalar<std::int64_t>(doc->get("x"));
/// @endcode
class Map {
public:
    /// Construct an empty, frozen map with the given identity.
    explicit Map(ObjectId object_id);

    Map(const Map&) = delete;
    auto operator=(const Map&) -> Map& = delete;

    /// The stable identity of this container.
    auto object_id() const -> const ObjectId& { return object_id_; }

    /// True unless an apply is in progress on this map.
    auto frozen() const noexcept -> bool { return frozen_; }

    // -- Reading --------------------------------------------------------------

    auto size() const -> std::size_t { return values_.size(); }
    auto empty() const -> bool { return values_.empty(); }
    auto contains(std::string_view key) const -> bool;

    /// Get the winning value at a key.
    /// @return The value, or nullopt if the key doesn't exist.
    auto get(std::string_view key) const -> std::optional<Value>;

    /// All keys, in sorted order.
    auto keys() const -> std::vector<std::string>;

    /// All candidates at a key, or nullptr if the key has no history.
    auto conflicts(std::string_view key) const -> const Conflicts*;

    auto entries() const -> const std::map<std::string, Value, std::less<>>& {
        return values_;
    }

    auto recent_ops() const -> const std::map<std::string, Conflicts, std::less<>>& {
        return recent_ops_;
    }

    // -- Mutation (only while an apply is in progress) ------------------------

    /// Set the visible value and the candidate history of a key.
    void put(std::string key, Value value, Conflicts conflicts);

    /// Remove a key and its history. Removing a missing key is a no-op.
    void erase(std::string_view key);

private:
    friend class detail::FrozenGuard;

    void check_mutable() const;

    ObjectId object_id_;
    std::map<std::string, Value, std::less<>> values_;
    std::map<std::string, Conflicts, std::less<>> recent_ops_;
    bool frozen_{true};
};

/// An ordered container in the document tree.
///
/// A List keeps three sequences in lock-step: the visible values, the
/// element ids that identify each position, and the candidate history
/// of each position. Slots inserted by a structural edit stay unset
/// until a value is merged into them.
class List {
public:
    /// Construct an empty, frozen list with the given identity.
    explicit List(ObjectId object_id);

    List(const List&) = delete;
    auto operator=(const List&) -> List& = delete;

    auto object_id() const -> const ObjectId& { return object_id_; }
    auto frozen() const noexcept -> bool { return frozen_; }

    // -- Reading --------------------------------------------------------------

    auto size() const -> std::size_t { return values_.size(); }
    auto empty() const -> bool { return values_.empty(); }

    /// Get the value at an index.
    /// @return The value, or nullopt if the index is out of bounds or unset.
    auto get(std::size_t index) const -> std::optional<Value>;

    /// The element id at an index.
    /// @throws std::out_of_range if index >= size().
    auto elem_id(std::size_t index) const -> const OpId&;

    /// All candidates at an index, or nullptr if out of bounds or unset.
    auto conflicts(std::size_t index) const -> const Conflicts*;

    auto values() const -> const std::vector<std::optional<Value>>& { return values_; }
    auto elem_ids() const -> const std::vector<OpId>& { return elem_ids_; }
    auto recent_ops() const -> const std::vector<std::optional<Conflicts>>& {
        return recent_ops_;
    }

    // -- Mutation (only while an apply is in progress) ------------------------
    // Index arguments are checked; out of range throws std::out_of_range.

    /// Insert an unset slot identified by elem_id before index.
    void insert(std::size_t index, OpId elem_id);

    /// Remove the slot at index from all three sequences.
    void remove(std::size_t index);

    /// Set the visible value and the candidate history at index.
    void put(std::size_t index, Value value, Conflicts conflicts);

    /// Reset the value and history at index to unset, keeping the slot.
    void unset(std::size_t index);

private:
    friend class detail::FrozenGuard;

    void check_mutable() const;
    void check_index(std::size_t index, std::size_t bound) const;

    ObjectId object_id_;
    std::vector<std::optional<Value>> values_;
    std::vector<OpId> elem_ids_;
    std::vector<std::optional<Conflicts>> recent_ops_;
    bool frozen_{true};
};

}  // namespace docmerge_cpp

#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/error.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace docmerge_cpp {

// =============================================================================
// Map
// =============================================================================

Map::Map(ObjectId object_id) : object_id_{std::move(object_id)} {}

void Map::check_mutable() const {
    if (frozen_) {
        throw Exception{ErrorKind::frozen_object,
                        fmt::format("map {} is frozen", object_id_)};
    }
}

auto Map::contains(std::string_view key) const -> bool {
    return values_.find(key) != values_.end();
}

auto Map::get(std::string_view key) const -> std::optional<Value> {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

auto Map::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

auto Map::conflicts(std::string_view key) const -> const Conflicts* {
    auto it = recent_ops_.find(key);
    return it != recent_ops_.end() ? &it->second : nullptr;
}

void Map::put(std::string key, Value value, Conflicts conflicts) {
    check_mutable();
    values_.insert_or_assign(key, std::move(value));
    recent_ops_.insert_or_assign(std::move(key), std::move(conflicts));
}

void Map::erase(std::string_view key) {
    check_mutable();
    if (auto it = values_.find(key); it != values_.end()) values_.erase(it);
    if (auto it = recent_ops_.find(key); it != recent_ops_.end()) recent_ops_.erase(it);
}

// =============================================================================
// List
// =============================================================================

List::List(ObjectId object_id) : object_id_{std::move(object_id)} {}

void List::check_mutable() const {
    if (frozen_) {
        throw Exception{ErrorKind::frozen_object,
                        fmt::format("list {} is frozen", object_id_)};
    }
}

void List::check_index(std::size_t index, std::size_t bound) const {
    if (index >= bound) {
        throw std::out_of_range{
            fmt::format("index {} out of range for list {} of size {}",
                        index, object_id_, values_.size())};
    }
}

auto List::get(std::size_t index) const -> std::optional<Value> {
    if (index >= values_.size()) return std::nullopt;
    return values_[index];
}

auto List::elem_id(std::size_t index) const -> const OpId& {
    check_index(index, elem_ids_.size());
    return elem_ids_[index];
}

auto List::conflicts(std::size_t index) const -> const Conflicts* {
    if (index >= recent_ops_.size() || !recent_ops_[index]) return nullptr;
    return &*recent_ops_[index];
}

void List::insert(std::size_t index, OpId elem_id) {
    check_mutable();
    check_index(index, values_.size() + 1);
    const auto pos = static_cast<std::ptrdiff_t>(index);
    elem_ids_.insert(std::next(elem_ids_.begin(), pos), std::move(elem_id));
    values_.insert(std::next(values_.begin(), pos), std::nullopt);
    recent_ops_.insert(std::next(recent_ops_.begin(), pos), std::nullopt);
}

void List::remove(std::size_t index) {
    check_mutable();
    check_index(index, values_.size());
    const auto pos = static_cast<std::ptrdiff_t>(index);
    elem_ids_.erase(std::next(elem_ids_.begin(), pos));
    values_.erase(std::next(values_.begin(), pos));
    recent_ops_.erase(std::next(recent_ops_.begin(), pos));
}

void List::put(std::size_t index, Value value, Conflicts conflicts) {
    check_mutable();
    check_index(index, values_.size());
    values_[index] = std::move(value);
    recent_ops_[index] = std::move(conflicts);
}

void List::unset(std::size_t index) {
    check_mutable();
    check_index(index, values_.size());
    values_[index].reset();
    recent_ops_[index].reset();
}

}  // namespace docmerge_cpp

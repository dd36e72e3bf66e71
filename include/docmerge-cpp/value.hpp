/// @file value.hpp
/// @brief Value types: ScalarValue, Value, ObjType, and tag types.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <docmerge-cpp/types.hpp>

namespace docmerge_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A CRDT counter register.
///
/// Only the current value is materialized here; increments are folded
/// in by the producing side before the patch is sent.
struct Counter {
    std::int64_t value{0};  ///< The current counter value.

    auto operator<=>(const Counter&) const = default;
    auto operator==(const Counter&) const -> bool = default;
};

/// The two kinds of container objects.
enum class ObjType : std::uint8_t {
    map,   ///< An unordered key-value map.
    list,  ///< An ordered sequence addressed by element id.
};

/// Convert an ObjType to its string representation.
constexpr auto to_string_view(ObjType type) noexcept -> std::string_view {
    switch (type) {
        case ObjType::map:  return "map";
        case ObjType::list: return "list";
    }
    return "unknown";
}

/// A closed set of primitive values stored in the document.
///
/// Alternatives: Null, bool, int64_t, uint64_t, double, Counter, string.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    std::uint64_t,
    double,
    Counter,
    std::string
>;

class Map;
class List;

/// A value in the document tree: a scalar or a shared container.
///
/// Containers are held by shared_ptr so that a deep merge mutates the
/// same node every holder observes.
using Value = std::variant<ScalarValue, std::shared_ptr<Map>, std::shared_ptr<List>>;

/// Every candidate value last seen for one slot, keyed by the operation
/// that wrote it.
using Conflicts = std::map<OpId, Value>;

/// Check if a Value holds a scalar (not a container).
constexpr auto is_scalar(const Value& v) -> bool {
    return std::holds_alternative<ScalarValue>(v);
}

/// Check if a Value holds a container (map or list).
constexpr auto is_object(const Value& v) -> bool {
    return !std::holds_alternative<ScalarValue>(v);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const ScalarValue& s) { ... },
///     [](const std::shared_ptr<Map>& m) { ... },
///     [](const std::shared_ptr<List>& l) { ... },
/// }, some_value);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
/// @code
/// auto name = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* sv = std::get_if<ScalarValue>(&v)) {
        if (const auto* t = std::get_if<T>(sv)) {
            return *t;
        }
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<Value>.
template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

/// The map held by a Value, or nullptr.
inline auto get_map(const Value& v) -> std::shared_ptr<Map> {
    if (const auto* m = std::get_if<std::shared_ptr<Map>>(&v)) return *m;
    return nullptr;
}

/// The list held by a Value, or nullptr.
inline auto get_list(const Value& v) -> std::shared_ptr<List> {
    if (const auto* l = std::get_if<std::shared_ptr<List>>(&v)) return *l;
    return nullptr;
}

}  // namespace docmerge_cpp

/// @file types.hpp
/// @brief Core identity types: OpId (Lamport timestamp) and ObjectId.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace docmerge_cpp {

/// Identifies a single operation: (counter, actor).
///
/// OpIds are Lamport timestamps. They are totally ordered by counter
/// first; ties are broken by comparing the actor ids as byte strings.
/// The external encoding is "<counter>@<actor>".
struct OpId {
    std::uint64_t counter{0};  ///< Lamport counter.
    std::string actor{};       ///< The actor that created this operation.

    OpId() = default;

    /// Construct with a counter and actor.
    OpId(std::uint64_t c, std::string a) : counter{c}, actor{std::move(a)} {}

    auto operator<=>(const OpId&) const = default;
    auto operator==(const OpId&) const -> bool = default;
};

/// Stable identity of a map or list container.
using ObjectId = std::string;

/// Parse "<counter>@<actor>" into an OpId.
/// @throws Exception with ErrorKind::malformed_identifier if the text
///   does not start with one or more digits followed by '@'.
auto parse_op_id(std::string_view text) -> OpId;

/// Render an OpId as "<counter>@<actor>".
auto to_string(const OpId& id) -> std::string;

/// Compare two OpIds in Lamport order.
inline auto lamport_compare(const OpId& a, const OpId& b) -> std::strong_ordering {
    if (a.counter != b.counter) return a.counter <=> b.counter;
    auto c = a.actor.compare(b.actor);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

/// Compare two encoded identifiers in Lamport order. Parses both first.
auto lamport_compare(std::string_view a, std::string_view b) -> std::strong_ordering;

}  // namespace docmerge_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<docmerge_cpp::OpId> {
    auto operator()(const docmerge_cpp::OpId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.counter);
        auto h2 = std::hash<std::string>{}(id.actor);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond

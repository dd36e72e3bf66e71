#include <docmerge-cpp/json.hpp>
#include <docmerge-cpp/error.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace docmerge_cpp {

namespace {

[[noreturn]] void invalid_patch(std::string message) {
    throw Exception{ErrorKind::invalid_patch, std::move(message)};
}

auto scalar_from_json(const nlohmann::json& j) -> ScalarValue {
    if (j.is_null()) return Null{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        // If it fits in int64, prefer int64 for consistency
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(val);
        }
        return val;
    }
    if (j.is_number_integer()) return j.get<std::int64_t>();
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    invalid_patch(fmt::format("cannot convert JSON {} to a scalar value", j.type_name()));
}

auto counter_from_json(const nlohmann::json& j) -> Counter {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(max)) {
            invalid_patch(fmt::format("counter value {} out of range", val));
        }
        return Counter{static_cast<std::int64_t>(val)};
    }
    if (j.is_number_integer()) return Counter{j.get<std::int64_t>()};
    if (j.is_number_float()) {
        // 2^63 is exact as a double; every integral value in [-2^63, 2^63) fits.
        constexpr auto limit = 9223372036854775808.0;
        auto d = j.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d || d < -limit || d >= limit) {
            invalid_patch(fmt::format("counter value {} is not a 64-bit integer", d));
        }
        return Counter{static_cast<std::int64_t>(d)};
    }
    invalid_patch(fmt::format("counter value must be a number, got {}", j.type_name()));
}

auto parse_list_index(std::string_view key) -> std::size_t {
    auto index = std::size_t{0};
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
    if (key.empty() || ec != std::errc{} || ptr != key.data() + key.size()) {
        invalid_patch(fmt::format("list props key '{}' is not an index", key));
    }
    return index;
}

auto parse_sub_patch(const nlohmann::json& j) -> SubPatch {
    if (!j.is_object()) {
        invalid_patch(fmt::format("sub-patch must be an object, got {}", j.type_name()));
    }
    if (j.contains("objectId")) {
        return make_sub_patch(parse_patch(j));
    }
    auto it = j.find("value");
    if (it == j.end()) {
        invalid_patch("leaf sub-patch has no value");
    }
    if (j.contains("datatype")) {
        return make_sub_patch(ScalarValue{counter_from_json(*it)});
    }
    return make_sub_patch(scalar_from_json(*it));
}

auto parse_conflicts(const nlohmann::json& j, std::string_view slot) -> PatchConflicts {
    if (!j.is_object()) {
        invalid_patch(fmt::format("conflict set for '{}' must be an object", slot));
    }
    auto result = PatchConflicts{};
    for (const auto& [op_id, sub] : j.items()) {
        auto [it, inserted] = result.emplace(parse_op_id(op_id), parse_sub_patch(sub));
        if (!inserted) {
            invalid_patch(fmt::format("conflict set for '{}' names op {} twice",
                                      slot, to_string(it->first)));
        }
    }
    return result;
}

auto parse_edit(const nlohmann::json& j) -> ListEdit {
    if (!j.is_object()) invalid_patch("list edit must be an object");

    auto action = j.find("action");
    if (action == j.end() || !action->is_string()) {
        invalid_patch("list edit has no action");
    }
    auto index = j.find("index");
    if (index == j.end() || !index->is_number_unsigned()) {
        invalid_patch("list edit has no valid index");
    }

    auto edit = ListEdit{.action = EditAction::insert, .index = index->get<std::size_t>()};
    const auto& name = action->get_ref<const std::string&>();
    if (name == "insert") {
        auto elem = j.find("elemId");
        if (elem == j.end() || !elem->is_string()) {
            invalid_patch(fmt::format("insert at {} has no elemId", edit.index));
        }
        edit.elem_id = parse_op_id(elem->get_ref<const std::string&>());
    } else if (name == "remove") {
        edit.action = EditAction::remove;
    } else {
        invalid_patch(fmt::format("unknown list edit action: {}", name));
    }
    return edit;
}

auto object_id_of(const nlohmann::json& j) -> ObjectId {
    auto it = j.find("objectId");
    if (it == j.end()) return ObjectId{};
    if (!it->is_string()) invalid_patch("objectId must be a string");
    return it->get<std::string>();
}

auto export_conflict_set(const Conflicts& conflicts) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [id, value] : conflicts) {
        result[to_string(id)] = export_json(value);
    }
    return result;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Counter& c) {
    j = nlohmann::json{{"datatype", "counter"}, {"value", c.value}};
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const Counter& c) { to_json(j, c); },
        [&](const std::string& s) { j = s; },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_object() && j.contains("datatype") && j.contains("value")) {
        sv = counter_from_json(j["value"]);
        return;
    }
    sv = scalar_from_json(j);
}

void to_json(nlohmann::json& j, const OpId& id) {
    j = to_string(id);
}

void from_json(const nlohmann::json& j, OpId& id) {
    if (!j.is_string()) {
        throw Exception{ErrorKind::malformed_identifier,
                        fmt::format("op id must be a string, got {}", j.type_name())};
    }
    id = parse_op_id(j.get_ref<const std::string&>());
}

// =============================================================================
// Patch ingestion
// =============================================================================

auto parse_patch(const nlohmann::json& j) -> ObjectPatch {
    if (!j.is_object()) {
        invalid_patch(fmt::format("patch must be an object, got {}", j.type_name()));
    }
    auto type = j.find("type");
    if (type == j.end()) invalid_patch("patch has no type");
    if (!type->is_string() || (*type != "map" && *type != "list")) {
        throw Exception{ErrorKind::unknown_patch_type,
                        fmt::format("unknown object type in patch: {}", type->dump())};
    }

    auto props = j.find("props");
    if (props != j.end() && !props->is_object()) invalid_patch("props must be an object");
    auto edits = j.find("edits");
    if (edits != j.end() && !edits->is_array()) invalid_patch("edits must be an array");

    if (*type == "map") {
        if (edits != j.end()) invalid_patch("map patch cannot carry edits");
        auto patch = MapPatch{.object_id = object_id_of(j), .props = std::nullopt};
        if (props != j.end()) {
            auto& out = patch.props.emplace();
            for (const auto& [key, conflicts] : props->items()) {
                out.emplace(key, parse_conflicts(conflicts, key));
            }
        }
        return ObjectPatch{std::move(patch)};
    }

    auto patch = ListPatch{.object_id = object_id_of(j), .edits = std::nullopt, .props = std::nullopt};
    if (edits != j.end()) {
        auto& out = patch.edits.emplace();
        out.reserve(edits->size());
        for (const auto& edit : *edits) {
            out.push_back(parse_edit(edit));
        }
    }
    if (props != j.end()) {
        auto& out = patch.props.emplace();
        for (const auto& [key, conflicts] : props->items()) {
            out.emplace(parse_list_index(key), parse_conflicts(conflicts, key));
        }
    }
    return ObjectPatch{std::move(patch)};
}

// =============================================================================
// Document export
// =============================================================================

auto export_json(const Value& value) -> nlohmann::json {
    return std::visit(overload{
        [](const ScalarValue& sv) -> nlohmann::json {
            return std::visit(overload{
                [](Null) -> nlohmann::json { return nullptr; },
                [](bool b) -> nlohmann::json { return b; },
                [](std::int64_t i) -> nlohmann::json { return i; },
                [](std::uint64_t u) -> nlohmann::json { return u; },
                [](double d) -> nlohmann::json { return d; },
                [](const Counter& c) -> nlohmann::json { return c.value; },
                [](const std::string& s) -> nlohmann::json { return s; },
            }, sv);
        },
        [](const std::shared_ptr<Map>& map) -> nlohmann::json {
            auto result = nlohmann::json::object();
            if (!map) return result;
            for (const auto& [key, val] : map->entries()) {
                result[key] = export_json(val);
            }
            return result;
        },
        [](const std::shared_ptr<List>& list) -> nlohmann::json {
            auto result = nlohmann::json::array();
            if (!list) return result;
            for (const auto& slot : list->values()) {
                result.push_back(slot ? export_json(*slot) : nlohmann::json{});
            }
            return result;
        },
    }, value);
}

auto export_conflicts(const Map& map) -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [key, conflicts] : map.recent_ops()) {
        result[key] = export_conflict_set(conflicts);
    }
    return result;
}

auto export_conflicts(const List& list) -> nlohmann::json {
    auto result = nlohmann::json::array();
    for (const auto& slot : list.recent_ops()) {
        result.push_back(slot ? export_conflict_set(*slot) : nlohmann::json{});
    }
    return result;
}

}  // namespace docmerge_cpp

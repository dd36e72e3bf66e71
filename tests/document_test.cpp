#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/error.hpp>

// Internal header for the mutation guard
#include "../src/apply_state.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace docmerge_cpp;

namespace {

auto scalar(std::int64_t v) -> Value { return Value{ScalarValue{v}}; }

auto history(const OpId& id, std::int64_t v) -> Conflicts {
    auto c = Conflicts{};
    c.emplace(id, scalar(v));
    return c;
}

}  // namespace

// -- Map: construction --------------------------------------------------------

TEST(Map, starts_empty_and_frozen) {
    const auto map = Map{"_root"};
    EXPECT_EQ(map.object_id(), "_root");
    EXPECT_TRUE(map.frozen());
    EXPECT_TRUE(map.empty());
    EXPECT_EQ(map.size(), 0u);
    EXPECT_TRUE(map.keys().empty());
    EXPECT_FALSE(map.get("x").has_value());
    EXPECT_EQ(map.conflicts("x"), nullptr);
}

// -- Map: mutation guard ------------------------------------------------------

TEST(Map, put_on_frozen_map_throws) {
    auto map = Map{"_root"};
    try {
        map.put("x", scalar(1), history(OpId{1, "A"}, 1));
        FAIL() << "expected frozen_object";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::frozen_object);
    }
    EXPECT_TRUE(map.empty());
}

TEST(Map, erase_on_frozen_map_throws) {
    auto map = Map{"_root"};
    EXPECT_THROW(map.erase("x"), Exception);
}

TEST(Map, guard_unfreezes_for_its_lifetime) {
    auto map = Map{"_root"};
    {
        auto guard = detail::FrozenGuard{map};
        EXPECT_FALSE(map.frozen());
        map.put("x", scalar(1), history(OpId{1, "A"}, 1));
    }
    EXPECT_TRUE(map.frozen());
    EXPECT_EQ(get_scalar<std::int64_t>(map.get("x")), 1);
}

TEST(Map, guard_refreezes_when_unwinding) {
    auto map = Map{"_root"};
    try {
        auto guard = detail::FrozenGuard{map};
        throw std::runtime_error{"boom"};
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(map.frozen());
}

TEST(Map, nested_guards_restore_outer_state) {
    auto map = Map{"_root"};
    {
        auto outer = detail::FrozenGuard{map};
        {
            auto inner = detail::FrozenGuard{map};
            EXPECT_FALSE(map.frozen());
        }
        EXPECT_FALSE(map.frozen());
    }
    EXPECT_TRUE(map.frozen());
}

// -- Map: reading -------------------------------------------------------------

TEST(Map, put_records_value_and_history) {
    auto map = Map{"_root"};
    {
        auto guard = detail::FrozenGuard{map};
        map.put("b", scalar(2), history(OpId{2, "A"}, 2));
        map.put("a", scalar(1), history(OpId{1, "A"}, 1));
    }
    EXPECT_EQ(map.size(), 2u);
    EXPECT_TRUE(map.contains("a"));
    EXPECT_EQ(map.keys(), (std::vector<std::string>{"a", "b"}));
    ASSERT_NE(map.conflicts("b"), nullptr);
    EXPECT_EQ(map.conflicts("b")->size(), 1u);
    EXPECT_TRUE(map.conflicts("b")->contains(OpId{2, "A"}));
    EXPECT_EQ(map.recent_ops().size(), 2u);
}

TEST(Map, erase_removes_value_and_history) {
    auto map = Map{"_root"};
    auto guard = detail::FrozenGuard{map};
    map.put("x", scalar(1), history(OpId{1, "A"}, 1));
    map.erase("x");
    map.erase("never-there");
    EXPECT_FALSE(map.contains("x"));
    EXPECT_EQ(map.conflicts("x"), nullptr);
}

// -- List ---------------------------------------------------------------------

TEST(List, starts_empty_and_frozen) {
    const auto list = List{"1@A"};
    EXPECT_EQ(list.object_id(), "1@A");
    EXPECT_TRUE(list.frozen());
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.get(0).has_value());
    EXPECT_EQ(list.conflicts(0), nullptr);
}

TEST(List, mutation_on_frozen_list_throws) {
    auto list = List{"1@A"};
    EXPECT_THROW(list.insert(0, OpId{2, "A"}), Exception);
    EXPECT_TRUE(list.empty());
}

TEST(List, insert_adds_unset_slot_to_all_sequences) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    list.insert(0, OpId{2, "A"});

    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(list.elem_ids().size(), 1u);
    EXPECT_EQ(list.recent_ops().size(), 1u);
    EXPECT_FALSE(list.get(0).has_value());
    EXPECT_EQ(list.conflicts(0), nullptr);
    EXPECT_EQ(list.elem_id(0), (OpId{2, "A"}));
}

TEST(List, put_and_unset_keep_the_slot) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    list.insert(0, OpId{2, "A"});
    list.put(0, scalar(7), history(OpId{3, "A"}, 7));

    EXPECT_EQ(get_scalar<std::int64_t>(list.get(0)), 7);
    ASSERT_NE(list.conflicts(0), nullptr);

    list.unset(0);
    EXPECT_EQ(list.size(), 1u);
    EXPECT_FALSE(list.get(0).has_value());
    EXPECT_EQ(list.conflicts(0), nullptr);
    EXPECT_EQ(list.elem_id(0), (OpId{2, "A"}));
}

TEST(List, remove_erases_from_all_sequences) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    list.insert(0, OpId{2, "A"});
    list.insert(1, OpId{3, "A"});
    list.put(1, scalar(3), history(OpId{4, "A"}, 3));
    list.remove(0);

    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(list.elem_ids().size(), 1u);
    EXPECT_EQ(list.recent_ops().size(), 1u);
    EXPECT_EQ(list.elem_id(0), (OpId{3, "A"}));
    EXPECT_EQ(get_scalar<std::int64_t>(list.get(0)), 3);
}

TEST(List, out_of_range_indices_throw) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    EXPECT_THROW(list.insert(1, OpId{2, "A"}), std::out_of_range);
    EXPECT_THROW(list.remove(0), std::out_of_range);
    EXPECT_THROW(list.put(0, scalar(1), {}), std::out_of_range);
    EXPECT_THROW(list.unset(0), std::out_of_range);
    EXPECT_THROW((void)list.elem_id(0), std::out_of_range);
    EXPECT_EQ(list.size(), 0u);
}

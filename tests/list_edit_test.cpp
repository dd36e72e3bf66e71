#include <docmerge-cpp/docmerge.hpp>

// Internal header for the structural editor
#include "../src/apply_state.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docmerge_cpp;

namespace {

auto insert_at(std::size_t index, std::string elem_id) -> ListEdit {
    return ListEdit{.action = EditAction::insert, .index = index,
                    .elem_id = parse_op_id(elem_id)};
}

auto remove_at(std::size_t index) -> ListEdit {
    return ListEdit{.action = EditAction::remove, .index = index};
}

auto leaf(std::string op_id, std::string value) -> PatchConflicts {
    auto c = PatchConflicts{};
    c.emplace(parse_op_id(op_id), make_sub_patch(ScalarValue{std::move(value)}));
    return c;
}

auto elem_strings(const List& list) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& id : list.elem_ids()) result.push_back(to_string(id));
    return result;
}

auto value_strings(const List& list) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    for (const auto& slot : list.values()) {
        auto s = slot ? get_scalar<std::string>(*slot) : std::nullopt;
        result.push_back(s ? *s : "<unset>");
    }
    return result;
}

void expect_lock_step(const List& list) {
    EXPECT_EQ(list.values().size(), list.elem_ids().size());
    EXPECT_EQ(list.values().size(), list.recent_ops().size());
}

}  // namespace

// -- apply_edits --------------------------------------------------------------

TEST(ApplyEdits, inserts_grow_all_three_sequences) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    detail::apply_edits(list, {insert_at(0, "2@A"), insert_at(1, "3@A"), insert_at(0, "4@B")});

    EXPECT_EQ(elem_strings(list), (std::vector<std::string>{"4@B", "2@A", "3@A"}));
    EXPECT_EQ(value_strings(list), (std::vector<std::string>{"<unset>", "<unset>", "<unset>"}));
    expect_lock_step(list);
}

TEST(ApplyEdits, remove_shifts_later_elements) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    detail::apply_edits(list, {insert_at(0, "2@A"), insert_at(1, "3@A"), insert_at(2, "4@A"), remove_at(1)});

    EXPECT_EQ(elem_strings(list), (std::vector<std::string>{"2@A", "4@A"}));
    expect_lock_step(list);
}

TEST(ApplyEdits, insert_without_elem_id_is_rejected) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    try {
        detail::apply_edits(list, {ListEdit{.action = EditAction::insert, .index = 0}});
        FAIL() << "expected invalid_patch";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_patch);
    }
    EXPECT_TRUE(list.empty());
}

TEST(ApplyEdits, out_of_range_edits_are_rejected_before_mutation) {
    auto list = List{"1@A"};
    auto guard = detail::FrozenGuard{list};
    detail::apply_edits(list, {insert_at(0, "2@A")});

    EXPECT_THROW(detail::apply_edits(list, {insert_at(2, "3@A")}), Exception);
    EXPECT_THROW(detail::apply_edits(list, {remove_at(1)}), Exception);
    EXPECT_EQ(list.size(), 1u);
    expect_lock_step(list);
}

// -- apply_patch on lists -----------------------------------------------------

TEST(ListPatch, insert_then_props_fills_the_slot) {
    auto list = std::make_shared<List>("1@A");
    auto patch = ListPatch{.object_id = "1@A",
                           .edits = std::vector<ListEdit>{insert_at(0, "1@A")},
                           .props = std::map<std::size_t, PatchConflicts>{}};
    patch.props->emplace(0, leaf("1@A", "hello"));

    apply_patch(*list, patch);

    EXPECT_EQ(value_strings(*list), (std::vector<std::string>{"hello"}));
    EXPECT_EQ(elem_strings(*list), (std::vector<std::string>{"1@A"}));
    ASSERT_NE(list->conflicts(0), nullptr);
    EXPECT_TRUE(list->conflicts(0)->contains(parse_op_id("1@A")));
    EXPECT_TRUE(list->frozen());
}

TEST(ListPatch, insert_without_props_leaves_unset_slot) {
    auto list = List{"1@A"};
    apply_patch(list, ListPatch{.object_id = "1@A",
                                .edits = std::vector<ListEdit>{insert_at(0, "2@A")},
                                .props = std::nullopt});

    EXPECT_EQ(list.size(), 1u);
    EXPECT_FALSE(list.get(0).has_value());
    expect_lock_step(list);
}

TEST(ListPatch, props_refer_to_post_edit_positions) {
    auto list = List{"1@A"};
    auto first = ListPatch{.object_id = "1@A",
                           .edits = std::vector<ListEdit>{insert_at(0, "2@A"), insert_at(1, "3@A")},
                           .props = std::map<std::size_t, PatchConflicts>{}};
    first.props->emplace(0, leaf("2@A", "a"));
    first.props->emplace(1, leaf("3@A", "c"));
    apply_patch(list, first);

    auto second = ListPatch{.object_id = "1@A",
                            .edits = std::vector<ListEdit>{insert_at(1, "4@B")},
                            .props = std::map<std::size_t, PatchConflicts>{}};
    second.props->emplace(1, leaf("4@B", "b"));
    apply_patch(list, second);

    EXPECT_EQ(value_strings(list), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(elem_strings(list), (std::vector<std::string>{"2@A", "4@B", "3@A"}));
    ASSERT_NE(list.conflicts(2), nullptr);
    EXPECT_TRUE(list.conflicts(2)->contains(parse_op_id("3@A")));
    expect_lock_step(list);
}

TEST(ListPatch, remove_drops_value_elem_id_and_history) {
    auto list = List{"1@A"};
    auto setup = ListPatch{.object_id = "1@A",
                           .edits = std::vector<ListEdit>{insert_at(0, "2@A"), insert_at(1, "3@A")},
                           .props = std::map<std::size_t, PatchConflicts>{}};
    setup.props->emplace(0, leaf("2@A", "x"));
    setup.props->emplace(1, leaf("3@A", "y"));
    apply_patch(list, setup);

    apply_patch(list, ListPatch{.object_id = "1@A",
                                .edits = std::vector<ListEdit>{remove_at(0)},
                                .props = std::nullopt});

    EXPECT_EQ(value_strings(list), (std::vector<std::string>{"y"}));
    EXPECT_EQ(elem_strings(list), (std::vector<std::string>{"3@A"}));
    ASSERT_NE(list.conflicts(0), nullptr);
    EXPECT_TRUE(list.conflicts(0)->contains(parse_op_id("3@A")));
    expect_lock_step(list);
}

TEST(ListPatch, empty_conflict_set_clears_slot_but_keeps_position) {
    auto list = List{"1@A"};
    auto setup = ListPatch{.object_id = "1@A",
                           .edits = std::vector<ListEdit>{insert_at(0, "2@A")},
                           .props = std::map<std::size_t, PatchConflicts>{}};
    setup.props->emplace(0, leaf("2@A", "x"));
    apply_patch(list, setup);

    auto clear = ListPatch{.object_id = "1@A", .edits = std::nullopt,
                           .props = std::map<std::size_t, PatchConflicts>{}};
    clear.props->emplace(0, PatchConflicts{});
    apply_patch(list, clear);

    EXPECT_EQ(list.size(), 1u);
    EXPECT_FALSE(list.get(0).has_value());
    EXPECT_EQ(list.conflicts(0), nullptr);
    EXPECT_EQ(elem_strings(list), (std::vector<std::string>{"2@A"}));
    expect_lock_step(list);
}

TEST(ListPatch, props_index_out_of_range_is_rejected) {
    auto list = List{"1@A"};
    auto patch = ListPatch{.object_id = "1@A", .edits = std::nullopt,
                           .props = std::map<std::size_t, PatchConflicts>{}};
    patch.props->emplace(0, leaf("2@A", "x"));

    try {
        apply_patch(list, patch);
        FAIL() << "expected invalid_patch";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_patch);
    }
    EXPECT_TRUE(list.frozen());
}

TEST(ListPatch, lock_step_holds_across_mixed_edit_sequences) {
    auto list = List{"1@A"};
    auto counter = std::uint64_t{2};
    for (int round = 0; round < 10; ++round) {
        auto edits = std::vector<ListEdit>{};
        auto size = list.size();
        for (int i = 0; i < 4; ++i) {
            edits.push_back(insert_at(size / 2, std::to_string(counter++) + "@A"));
            ++size;
        }
        if (round % 3 == 2) {
            edits.push_back(remove_at(0));
            edits.push_back(remove_at(size - 2));
            size -= 2;
        }
        auto patch = ListPatch{.object_id = "1@A", .edits = std::move(edits),
                               .props = std::map<std::size_t, PatchConflicts>{}};
        patch.props->emplace(0, leaf(std::to_string(counter++) + "@B", "v"));
        apply_patch(list, patch);

        EXPECT_EQ(list.size(), size);
        expect_lock_step(list);
    }
}

// basic_usage: demonstrates core docmerge-cpp API
//
// Builds patch trees by hand, applies them to a root map, and reads the
// merged document back: visible winners, conflict history, nested
// containers, list edits, counters, and the frozen guard.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <docmerge-cpp/docmerge.hpp>

#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dm = docmerge_cpp;

static auto leaf(const char* op_id, dm::ScalarValue value) -> dm::PatchConflicts {
    auto c = dm::PatchConflicts{};
    c.emplace(dm::parse_op_id(op_id), dm::make_sub_patch(std::move(value)));
    return c;
}

int main() {
    auto root = std::make_shared<dm::Map>("_root");

    // -- A single writer ------------------------------------------------------
    auto first = dm::MapPatch{.object_id = "_root", .props = std::map<std::string, dm::PatchConflicts>{}};
    first.props->emplace("title", leaf("1@alice", std::string{"Shopping List"}));
    first.props->emplace("x", leaf("3@alice", std::int64_t{10}));
    dm::apply_patch(*root, first);

    std::printf("title = %s\n", dm::get_scalar<std::string>(root->get("title"))->c_str());
    std::printf("x     = %lld\n", static_cast<long long>(*dm::get_scalar<std::int64_t>(root->get("x"))));

    // -- Two concurrent writers: the Lamport-greatest op wins -----------------
    auto second = dm::MapPatch{.object_id = "_root", .props = std::map<std::string, dm::PatchConflicts>{}};
    auto& x = second.props->emplace("x", leaf("3@alice", std::int64_t{10})).first->second;
    x.emplace(dm::parse_op_id("4@bob"), dm::make_sub_patch(dm::ScalarValue{std::int64_t{20}}));
    dm::apply_patch(*root, second);

    std::printf("x     = %lld (after concurrent write)\n",
                static_cast<long long>(*dm::get_scalar<std::int64_t>(root->get("x"))));
    for (const auto& [op, value] : *root->conflicts("x")) {
        std::printf("  candidate %s -> %lld\n", dm::to_string(op).c_str(),
                    static_cast<long long>(*dm::get_scalar<std::int64_t>(value)));
    }

    // -- A nested list with structural edits ----------------------------------
    auto items = dm::ListPatch{
        .object_id = "5@alice",
        .edits = std::vector<dm::ListEdit>{
            {.action = dm::EditAction::insert, .index = 0, .elem_id = dm::parse_op_id("6@alice")},
            {.action = dm::EditAction::insert, .index = 1, .elem_id = dm::parse_op_id("7@alice")},
        },
        .props = std::map<std::size_t, dm::PatchConflicts>{},
    };
    items.props->emplace(0, leaf("6@alice", std::string{"Milk"}));
    items.props->emplace(1, leaf("7@alice", std::string{"Eggs"}));

    auto third = dm::MapPatch{.object_id = "_root", .props = std::map<std::string, dm::PatchConflicts>{}};
    auto& slot = third.props->emplace("items", dm::PatchConflicts{}).first->second;
    slot.emplace(dm::parse_op_id("5@alice"), dm::make_sub_patch(dm::ObjectPatch{std::move(items)}));
    third.props->emplace("visits", leaf("8@bob", dm::Counter{3}));
    dm::apply_patch(*root, third);

    auto list = dm::get_list(*root->get("items"));
    std::printf("items (%zu):\n", list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        std::printf("  [%zu] %s (elem %s)\n", i,
                    dm::get_scalar<std::string>(list->get(i))->c_str(),
                    dm::to_string(list->elem_id(i)).c_str());
    }
    std::printf("visits = %lld\n",
                static_cast<long long>(dm::get_scalar<dm::Counter>(root->get("visits"))->value));

    // -- Deleting a key with an empty conflict set ----------------------------
    auto fourth = dm::MapPatch{.object_id = "_root", .props = std::map<std::string, dm::PatchConflicts>{}};
    fourth.props->emplace("title", dm::PatchConflicts{});
    dm::apply_patch(*root, fourth);
    std::printf("has title: %s\n", root->contains("title") ? "yes" : "no");

    // -- Containers are frozen outside apply_patch ----------------------------
    try {
        root->erase("x");
    } catch (const dm::Exception& e) {
        std::printf("direct mutation rejected: %s\n", e.what());
    }

    return 0;
}

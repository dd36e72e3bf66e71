// docmerge-cpp benchmarks: measures throughput of patch application.

#include <docmerge-cpp/docmerge.hpp>
#include <docmerge-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace docmerge_cpp;

static auto leaf(OpId id, std::int64_t v) -> PatchConflicts {
    auto c = PatchConflicts{};
    c.emplace(std::move(id), make_sub_patch(ScalarValue{v}));
    return c;
}

static auto wide_map_patch(std::size_t keys, std::uint64_t counter) -> MapPatch {
    auto patch = MapPatch{.object_id = "_root", .props = std::map<std::string, PatchConflicts>{}};
    for (std::size_t i = 0; i < keys; ++i) {
        patch.props->emplace("key" + std::to_string(i),
                             leaf(OpId{counter, "A"}, static_cast<std::int64_t>(i)));
    }
    return patch;
}

// =============================================================================
// Map patches
// =============================================================================

static void bm_map_patch_single_key(benchmark::State& state) {
    auto root = Map{"_root"};
    std::uint64_t counter = 1;
    for (auto _ : state) {
        auto patch = MapPatch{.object_id = "_root", .props = std::map<std::string, PatchConflicts>{}};
        patch.props->emplace("key", leaf(OpId{counter++, "A"}, 1));
        apply_patch(root, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_map_patch_single_key);

static void bm_map_patch_wide(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto root = Map{"_root"};
    const auto patch = wide_map_patch(n, 1);
    for (auto _ : state) {
        apply_patch(root, patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_map_patch_wide)->Range(10, 1000);

static void bm_map_patch_conflicts(benchmark::State& state) {
    const auto writers = static_cast<std::uint64_t>(state.range(0));
    auto root = Map{"_root"};
    auto patch = MapPatch{.object_id = "_root", .props = std::map<std::string, PatchConflicts>{}};
    auto& slot = patch.props->emplace("x", PatchConflicts{}).first->second;
    for (std::uint64_t w = 0; w < writers; ++w) {
        slot.emplace(OpId{w + 1, "actor" + std::to_string(w)},
                     make_sub_patch(ScalarValue{static_cast<std::int64_t>(w)}));
    }
    for (auto _ : state) {
        apply_patch(root, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_map_patch_conflicts)->Arg(2)->Arg(8)->Arg(64);

// =============================================================================
// Nested patches
// =============================================================================

static void bm_nested_in_place_merge(benchmark::State& state) {
    const auto depth = static_cast<int>(state.range(0));

    auto build = [depth](std::int64_t v) {
        auto inner = ObjectPatch{MapPatch{.object_id = std::to_string(depth + 1) + "@A",
                                          .props = std::map<std::string, PatchConflicts>{}}};
        std::get<MapPatch>(inner.inner).props->emplace("v", leaf(OpId{100, "A"}, v));
        for (int d = depth; d >= 1; --d) {
            auto outer = MapPatch{.object_id = std::to_string(d) + "@A",
                                  .props = std::map<std::string, PatchConflicts>{}};
            auto& slot = outer.props->emplace("child", PatchConflicts{}).first->second;
            slot.emplace(OpId{static_cast<std::uint64_t>(d + 1), "A"}, make_sub_patch(std::move(inner)));
            inner = ObjectPatch{std::move(outer)};
        }
        return inner;
    };

    auto doc = apply_patch(std::nullopt, build(0));
    const auto patch = build(1);
    for (auto _ : state) {
        apply_patch(doc, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_nested_in_place_merge)->Arg(1)->Arg(8)->Arg(32);

// =============================================================================
// List patches
// =============================================================================

static void bm_list_insert_append(benchmark::State& state) {
    auto list = List{"1@A"};
    std::uint64_t counter = 2;
    for (auto _ : state) {
        const auto index = list.size();
        auto id = OpId{counter++, "A"};
        auto patch = ListPatch{.object_id = "1@A",
                               .edits = std::vector<ListEdit>{{.action = EditAction::insert, .index = index, .elem_id = id}},
                               .props = std::map<std::size_t, PatchConflicts>{}};
        patch.props->emplace(index, leaf(id, 42));
        apply_patch(list, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_list_insert_append);

static void bm_list_insert_front(benchmark::State& state) {
    auto list = List{"1@A"};
    std::uint64_t counter = 2;
    for (auto _ : state) {
        auto patch = ListPatch{.object_id = "1@A",
                               .edits = std::vector<ListEdit>{{.action = EditAction::insert, .index = 0,
                                                               .elem_id = OpId{counter++, "A"}}},
                               .props = std::nullopt};
        apply_patch(list, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_list_insert_front);

// =============================================================================
// JSON ingestion and export
// =============================================================================

static void bm_parse_patch(benchmark::State& state) {
    const auto j = nlohmann::json::parse(R"({
        "type": "map", "objectId": "_root",
        "props": {
            "x": {"3@A": {"value": 10}, "4@B": {"value": 20}},
            "items": {"5@A": {"type": "list", "objectId": "5@A",
                              "edits": [{"action": "insert", "index": 0, "elemId": "6@A"}],
                              "props": {"0": {"6@A": {"value": "milk"}}}}}
        }
    })");
    for (auto _ : state) {
        auto patch = parse_patch(j);
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_patch);

static void bm_export_json(benchmark::State& state) {
    auto root = std::make_shared<Map>("_root");
    apply_patch(*root, wide_map_patch(100, 1));
    const auto doc = Value{root};
    for (auto _ : state) {
        auto j = export_json(doc);
        benchmark::DoNotOptimize(j);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_export_json);

// docmerge_apply: apply a file of JSON patches to an empty document
//
// Usage: docmerge_apply <patches.json> [--conflicts]
//
// The input is a JSON array of patch trees (or a single patch object).
// Each patch is applied in order to a root map and the materialized
// document is printed as JSON. With --conflicts the root's conflict
// history is printed as well.
//
// Build: cmake --build build
// Run:   ./build/examples/docmerge_apply patches.json

#include <docmerge-cpp/docmerge.hpp>
#include <docmerge-cpp/json.hpp>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <memory>
#include <string_view>

namespace dm = docmerge_cpp;
using json = nlohmann::json;

static void print_usage(const char* program) {
    fmt::print(stderr, "usage: {} <patches.json> [--conflicts]\n", program);
}

int main(int argc, char** argv) {
    const char* path = nullptr;
    bool show_conflicts = false;
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--conflicts") {
            show_conflicts = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (path == nullptr) {
            path = argv[i];
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (path == nullptr) {
        print_usage(argv[0]);
        return 2;
    }

    auto in = std::ifstream{path};
    if (!in) {
        fmt::print(stderr, "error: cannot open {}\n", path);
        return 1;
    }

    json input;
    try {
        input = json::parse(in);
    } catch (const json::parse_error& e) {
        fmt::print(stderr, "error: {}: {}\n", path, e.what());
        return 1;
    }
    if (!input.is_array()) input = json::array({std::move(input)});

    auto root = std::make_shared<dm::Map>("_root");
    for (std::size_t i = 0; i < input.size(); ++i) {
        try {
            dm::apply_patch(dm::Value{root}, dm::parse_patch(input[i]));
        } catch (const dm::Exception& e) {
            fmt::print(stderr, "error: patch {}: {}\n", i, e.what());
            return 1;
        }
    }

    fmt::print("{}\n", dm::export_json(dm::Value{root}).dump(2));
    if (show_conflicts) {
        fmt::print("{}\n", dm::export_conflicts(*root).dump(2));
    }
    return 0;
}

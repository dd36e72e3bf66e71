// Fuzz target for patch ingestion and application. Exercises JSON
// parsing, patch validation, and the merge engine on arbitrary input.
// Any patch that is accepted is applied a second time, then exported.

#include <docmerge-cpp/docmerge.hpp>
#include <docmerge-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace dm = docmerge_cpp;

    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    try {
        const auto patch = dm::parse_patch(j);
        auto doc = dm::apply_patch(std::nullopt, patch);
        doc = dm::apply_patch(doc, patch);
        auto exported = dm::export_json(doc);
        (void)exported;
    } catch (const dm::Exception&) {
        // Rejected input is expected
    }
    return 0;
}

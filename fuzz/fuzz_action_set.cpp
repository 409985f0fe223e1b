// Fuzz target for action descriptor classification and normalization
// Parses the input as a JSON actions map and checks:
// - no Disabled descriptor survives normalization
// - "undo" is gone when dropped, "_resign" is last when injected
// - every ArgumentPool is non-empty
//
// Target code:
// - src/driver/action_set.cpp (ClassifyDescriptor, NormalizeActions)

#include "driver/action_set.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace rttfuzz::driver;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) {
        return 0;
    }

    NormalizeOptions options;
    options.drop_undo = (data[0] & 1) != 0;
    options.inject_resign = (data[0] & 2) != 0;

    std::string text(reinterpret_cast<const char*>(data + 1), size - 1);
    json actions = json::parse(text, nullptr, false);
    if (actions.is_discarded()) {
        return 0;
    }

    auto normalized = NormalizeActions(actions, options);

    for (size_t i = 0; i < normalized.size(); ++i) {
        const auto &action = normalized[i];
        if (action.descriptor.kind == ActionDescriptor::Kind::Disabled) {
            // Disabled action offered - BUG!
            __builtin_trap();
        }
        if (action.descriptor.kind == ActionDescriptor::Kind::ArgumentPool && action.descriptor.pool.empty()) {
            // Empty pool would make the argument pick impossible - BUG!
            __builtin_trap();
        }
        if (options.drop_undo && action.name == UNDO_ACTION) {
            __builtin_trap();
        }
        if (action.name == RESIGN_ACTION && (!options.inject_resign || i + 1 != normalized.size())) {
            if (!options.inject_resign && actions.is_object()) {
                // Engine-advertised "_resign" passes through untouched
                continue;
            }
            __builtin_trap();
        }
    }

    if (options.inject_resign && (normalized.empty() || normalized.back().name != RESIGN_ACTION)) {
        __builtin_trap();
    }

    return 0;
}

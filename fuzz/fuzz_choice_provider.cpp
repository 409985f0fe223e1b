// Fuzz target for ChoiceProvider
// Checks the decision invariants the driver relies on:
// - every draw lands in [min, max]
// - consumption never exceeds the input and never grows RemainingBytes()
// - PickIndex() is always a valid index
// - two providers over the same bytes make identical decisions

#include "driver/choice_provider.hpp"
#include <cstdint>
#include <cstddef>
#include <memory>

using namespace rttfuzz::driver;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) {
        return 0;
    }

    // First byte shapes the ranges; the rest feed the providers
    const uint8_t shape = data[0];
    ChoiceProvider a(std::make_unique<ByteStreamStrategy>(data + 1, size - 1));
    ChoiceProvider b(std::make_unique<ByteStreamStrategy>(data + 1, size - 1));

    int64_t bound = 1;
    size_t last_remaining = a.RemainingBytes();
    while (a.RemainingBytes() > 0) {
        bound = (bound * 31 + shape) % (int64_t{1} << 40) + 1;
        const int64_t min = -(bound / 3);
        const int64_t max = bound;

        int64_t x = a.BoundedInteger(min, max);
        int64_t y = b.BoundedInteger(min, max);
        if (x < min || x > max) {
            // Out of range - BUG!
            __builtin_trap();
        }
        if (x != y) {
            // Same bytes, different decision - BUG!
            __builtin_trap();
        }
        if (a.RemainingBytes() >= last_remaining) {
            // A non-trivial range must consume input - BUG!
            __builtin_trap();
        }
        last_remaining = a.RemainingBytes();

        size_t count = static_cast<size_t>(shape % 17) + 1;
        auto index = a.PickIndex(count);
        auto index_b = b.PickIndex(count);
        if (!index || *index >= count || index != index_b) {
            // Invalid or non-deterministic pick - BUG!
            __builtin_trap();
        }
        last_remaining = a.RemainingBytes();
    }

    // Empty collections are refused, not indexed
    if (a.PickIndex(0).has_value()) {
        __builtin_trap();
    }

    return 0;
}

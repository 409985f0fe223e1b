// Fuzz target for crash snapshots
// Writes fuzzed game states through CrashReporter and loads them back
//
// A snapshot is the only artifact left after a finding, so it must:
// - be written for any JSON state (including invalid UTF-8 in strings)
// - replace the previous snapshot completely
// - load back as the same JSON when the state is valid UTF-8
//
// Target code:
// - src/driver/crash_reporter.cpp (Report, LoadCrashState)
// - src/util/files.cpp (atomic_write_file, read_file)

#include "driver/crash_reporter.hpp"
#include "rules/rules_engine.hpp"
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <sstream>
#include <string>

using namespace rttfuzz;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string text(reinterpret_cast<const char*>(data), size);
    driver::json state = driver::json::parse(text, nullptr, false);
    if (state.is_discarded()) {
        // Not JSON - store it as a string field instead
        state = driver::json{{"raw", text}};
    }

    auto fuzz_dir = std::filesystem::temp_directory_path() / "rttfuzz_fuzz_snapshot";
    std::filesystem::create_directories(fuzz_dir);
    auto path = fuzz_dir / "crash-state.json";

    std::ostringstream diagnostics;
    driver::CrashReporter reporter(path, diagnostics);
    rules::GameSetup setup;
    driver::json view = {{"actions", {{"noop", true}}}};
    std::string active = "fuzzer";

    reporter.Report(driver::CrashContext{setup, state, view, 0, active, std::nullopt, std::nullopt});

    auto loaded = driver::LoadCrashState(path);
    if (!loaded) {
        // Snapshot missing or unreadable - BUG!
        __builtin_trap();
    }

    // Round trip must be exact unless strings had to be repaired on write
    std::string strict;
    try {
        strict = state.dump();
    } catch (const driver::json::type_error&) {
        std::filesystem::remove_all(fuzz_dir);
        return 0;
    }
    if (*loaded != driver::json::parse(strict)) {
        // Snapshot differs from the state - BUG!
        __builtin_trap();
    }

    std::filesystem::remove_all(fuzz_dir);
    return 0;
}

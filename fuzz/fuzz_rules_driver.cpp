// Fuzz target driving a rules module through whole games
// The input bytes choose seed, scenario, roles, actions and arguments
//
// Findings (each dumps the view and writes crash-state.json first):
// - BoundExceeded: game did not end within MAX_STEPS
// - NoActionsAvailable: dead end, game not over but nothing selectable
// - InvalidActionArgument: NaN in an argument pool
// - RulesEngineFailure: action()/resign() threw
//
// Environment: RTT_RULES, MAX_STEPS, NO_UNDO, NO_RESIGN, RND,
// RTT_CRASH_STATE, RTT_LOGLEVEL

#include "driver/driver_config.hpp"
#include "driver/fuzz_driver.hpp"
#include "rules/rules_library.hpp"
#include "util/logging.hpp"
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <memory>

using namespace rttfuzz;

namespace {

std::unique_ptr<rules::RulesLibrary> g_library;
std::unique_ptr<driver::FuzzDriver> g_driver;

}  // namespace

extern "C" int LLVMFuzzerInitialize(int *argc, char ***argv) {
    (void)argc;
    (void)argv;

    auto config = driver::DriverConfig::FromEnvironment();
    util::LogManager::Initialize(config.log_level);
    LOG_INFO("Loading rtt-fuzzer {}", config.Describe());

    try {
        g_library = rules::RulesLibrary::Open(config.rules_path);
    } catch (const std::exception &e) {
        LOG_ERROR("{}", e.what());
        std::exit(1);
    }
    g_driver = std::make_unique<driver::FuzzDriver>(g_library->engine(), config);
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    driver::RunOutcome outcome;
    try {
        outcome = g_driver->Run(data, size);
    } catch (const driver::FuzzError &e) {
        // Crash report already written - make libFuzzer save the input
        LOG_ERROR("{}", e.what());
        __builtin_trap();
    }

    if (outcome == driver::RunOutcome::InsufficientInput) {
        // Too short to mean anything - keep it out of the corpus
        return -1;
    }
    return 0;
}

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// rtt-replay: run saved fuzz inputs through the driver without libFuzzer

#include "driver/crash_reporter.hpp"
#include "driver/driver_config.hpp"
#include "driver/fuzz_driver.hpp"
#include "rules/rules_library.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using rttfuzz::driver::DriverConfig;

void PrintUsage(const char *program_name) {
  std::cout
      << "rtt-replay - replay fuzz inputs against a rules module\n\n"
      << "Usage: " << program_name << " [options] <input-file>...\n\n"
      << "Options (defaults come from the environment, see below):\n"
      << "  --rules=<path>        Rules module (RTT_RULES, default: rules.so)\n"
      << "  --max-steps=<n>       Step bound (MAX_STEPS, default: 2048)\n"
      << "  --no-undo             Never choose 'undo' (NO_UNDO=true)\n"
      << "  --no-resign           Never offer '_resign' (NO_RESIGN=true)\n"
      << "  --random              Ignore input bytes, draw at random (RND=true)\n"
      << "  --crash-state=<path>  Crash snapshot path (RTT_CRASH_STATE, default: crash-state.json)\n"
      << "  --from-state=<path>   Start from a saved snapshot instead of setup()\n"
      << "  --loglevel=<level>    trace, debug, info, warn, error, off (RTT_LOGLEVEL)\n"
      << "  --version             Show version information\n"
      << "  --help                Show this help message\n\n"
      << "Exit status is 0 when every input finished or was skipped, 1 on any finding.\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    DriverConfig config = DriverConfig::FromEnvironment();
    std::string from_state;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << rttfuzz::GetFullVersionString() << std::endl;
        return 0;
      } else if (arg.starts_with("--rules=")) {
        config.rules_path = arg.substr(8);
      } else if (arg.starts_with("--max-steps=")) {
        int steps = rttfuzz::driver::ParseMaxSteps(arg.substr(12).c_str(), -1);
        if (steps < 0) {
          std::cerr << "Error: --max-steps requires a positive integer\n";
          return 1;
        }
        config.max_steps = steps;
      } else if (arg == "--no-undo") {
        config.no_undo = true;
      } else if (arg == "--no-resign") {
        config.no_resign = true;
      } else if (arg == "--random") {
        config.random = true;
      } else if (arg.starts_with("--crash-state=")) {
        config.crash_state_path = arg.substr(14);
        if (config.crash_state_path.empty()) {
          std::cerr << "Error: --crash-state requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--from-state=")) {
        from_state = arg.substr(13);
      } else if (arg.starts_with("--loglevel=")) {
        config.log_level = arg.substr(11);
      } else if (arg.starts_with("--")) {
        std::cerr << "Error: unknown option " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      } else {
        inputs.push_back(arg);
      }
    }

    if (inputs.empty()) {
      std::cerr << "Error: no input files\n";
      PrintUsage(argv[0]);
      return 1;
    }

    rttfuzz::util::LogManager::Initialize(config.log_level);
    LOG_INFO("Loading rtt-replay {}", config.Describe());

    std::optional<nlohmann::json> start_state;
    if (!from_state.empty()) {
      start_state = rttfuzz::driver::LoadCrashState(from_state);
      if (!start_state) {
        std::cerr << "Error: cannot load snapshot " << from_state << "\n";
        return 1;
      }
    }

    auto library = rttfuzz::rules::RulesLibrary::Open(config.rules_path);
    rttfuzz::driver::FuzzDriver driver(library->engine(), config);

    int findings = 0;
    for (const auto &input : inputs) {
      if (!std::filesystem::is_regular_file(input)) {
        std::cerr << "Error: " << input << " is not a file\n";
        return 1;
      }
      auto data = rttfuzz::util::read_file(input);

      try {
        auto outcome = driver.Run(data.data(), data.size(), start_state);
        std::cout << input << ": " << rttfuzz::driver::RunOutcomeName(outcome) << " after "
                  << driver.last_step() << " steps (seed=" << driver.last_setup().seed
                  << " scenario=" << driver.last_setup().scenario << ")\n";
      } catch (const rttfuzz::driver::FuzzError &e) {
        ++findings;
        std::cout << input << ": " << e.what() << "\n";
      }

      for (const auto &decision : driver.last_decisions()) {
        LOG_DEBUG("  step={} role={} action={} arg={}", decision.step, decision.role, decision.action,
                  decision.arg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
      }
    }

    rttfuzz::util::LogManager::Shutdown();
    return findings == 0 ? 0 : 1;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

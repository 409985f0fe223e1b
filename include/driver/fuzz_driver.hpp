// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "driver/choice_provider.hpp"
#include "driver/crash_reporter.hpp"
#include "driver/driver_config.hpp"
#include "driver/fuzz_error.hpp"
#include "driver/turn_stepper.hpp"
#include "rules/rules_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace rttfuzz {
namespace driver {

using json = nlohmann::json;

/**
 * Entry point for one fuzz input
 *
 * Draws the seed (1 .. 2^35-31) and scenario from the input, builds the
 * initial state through the engine and runs a TurnStepper to the end.
 * Returns GameOver or InsufficientInput; findings propagate as FuzzError.
 * Exceptions from Setup() and View() propagate unchanged.
 *
 * One driver can run many inputs in sequence; it is not thread-safe.
 */
class FuzzDriver {
public:
  static constexpr int64_t MAX_SEED = (int64_t{1} << 35) - 31;

  FuzzDriver(rules::RulesEngine& engine, DriverConfig config, std::ostream& diagnostics = std::cout);

  FuzzDriver(const FuzzDriver&) = delete;
  FuzzDriver& operator=(const FuzzDriver&) = delete;

  // Strategy picked from config().random
  RunOutcome Run(const uint8_t* data, size_t size, const std::optional<json>& start_state = std::nullopt);

  // start_state, when given, replaces Setup(); seed and scenario are still drawn
  RunOutcome Run(std::unique_ptr<ChoiceStrategy> strategy, const std::optional<json>& start_state = std::nullopt);

  const DriverConfig& config() const { return config_; }
  const CrashReporter& reporter() const { return reporter_; }

  // Details of the most recent run, kept after findings too
  const rules::GameSetup& last_setup() const { return last_setup_; }
  const std::vector<Decision>& last_decisions() const { return last_decisions_; }
  const json& last_state() const { return last_state_; }
  int last_step() const { return last_step_; }

private:
  void Record(const TurnStepper& stepper);

  rules::RulesEngine& engine_;
  DriverConfig config_;
  CrashReporter reporter_;

  rules::GameSetup last_setup_;
  std::vector<Decision> last_decisions_;
  json last_state_;
  int last_step_{0};
};

}  // namespace driver
}  // namespace rttfuzz

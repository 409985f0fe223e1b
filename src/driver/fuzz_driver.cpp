// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/fuzz_driver.hpp"

#include "util/logging.hpp"

#include <utility>

namespace rttfuzz {
namespace driver {

FuzzDriver::FuzzDriver(rules::RulesEngine& engine, DriverConfig config, std::ostream& diagnostics)
    : engine_(engine), config_(std::move(config)), reporter_(config_.crash_state_path, diagnostics) {}

RunOutcome FuzzDriver::Run(const uint8_t* data, size_t size, const std::optional<json>& start_state) {
  return Run(MakeChoiceStrategy(config_.random, data, size), start_state);
}

RunOutcome FuzzDriver::Run(std::unique_ptr<ChoiceStrategy> strategy, const std::optional<json>& start_state) {
  ChoiceProvider choices(std::move(strategy));

  last_setup_ = rules::GameSetup{};
  last_decisions_.clear();
  last_state_ = json();
  last_step_ = 0;

  if (!choices.HasMinimumBytes(config_.min_input_bytes)) {
    LOG_DRIVER_TRACE("Skipping input: {} bytes, need {}", choices.RemainingBytes(), config_.min_input_bytes);
    return RunOutcome::InsufficientInput;
  }

  rules::GameSetup setup;
  setup.seed = choices.BoundedInteger(1, MAX_SEED);
  auto scenario = choices.PickOne(engine_.Scenarios());
  if (!scenario) {
    LOG_DRIVER_WARN("Rules engine offers no scenarios; skipping input");
    return RunOutcome::InsufficientInput;
  }
  setup.scenario = *scenario;
  setup.options = json::object();
  last_setup_ = setup;

  json state;
  if (start_state) {
    LOG_DRIVER_DEBUG("Resuming from snapshot (seed={} scenario={})", setup.seed, setup.scenario);
    state = *start_state;
  } else {
    state = engine_.Setup(setup.seed, setup.scenario, setup.options);
  }

  TurnStepper stepper(engine_, choices, reporter_, config_);
  try {
    RunOutcome outcome = stepper.Run(setup, std::move(state));
    Record(stepper);
    LOG_DRIVER_DEBUG("Run finished: {} after {} steps (seed={} scenario={})", RunOutcomeName(outcome),
                     stepper.step(), setup.seed, setup.scenario);
    return outcome;
  } catch (const FuzzError&) {
    Record(stepper);
    throw;
  }
}

void FuzzDriver::Record(const TurnStepper& stepper) {
  last_decisions_ = stepper.decisions();
  last_state_ = stepper.state();
  last_step_ = stepper.step();
}

}  // namespace driver
}  // namespace rttfuzz

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TurnStepper - the game loop of a single fuzz run

 Phases
   Init -> Running -> GameOver | InsufficientInput             (normal ends)
                   -> BoundExceeded | NoActions | InvalidArg | RulesCrash
                                                              (findings)

 One Step():
 1. stop with InsufficientInput if the provider is below min_input_bytes
 2. resolve the acting role ("Both"/"All" picks one of Roles())
 3. fetch the view for that role
 4. step > max_steps                -> BoundExceeded
 5. state["state"] == "game_over"   -> GameOver
 6. view has no actions             -> NoActions
 7. normalize (undo filter, _resign injection, drop disabled)
 8. nothing selectable              -> NoActions
 9. pick action, then argument from its pool (a pool value that does not
    read as a number -> InvalidArg)
 10. FuzzLog hook (errors propagate unchanged), apply through Action()/Resign()
     (throw -> RulesCrash)
 11. step += 1

 Every finding is dumped through the CrashReporter and thrown as FuzzError.
 The stepper is single-use and single-threaded.
*/

#include "driver/action_set.hpp"
#include "driver/choice_provider.hpp"
#include "driver/crash_reporter.hpp"
#include "driver/driver_config.hpp"
#include "driver/fuzz_error.hpp"
#include "rules/rules_engine.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rttfuzz {
namespace driver {

using json = nlohmann::json;

enum class TurnPhase {
  Init,
  Running,
  GameOver,
  BoundExceeded,
  NoActions,
  InvalidArg,
  RulesCrash,
  InsufficientInput,
};

const char* TurnPhaseName(TurnPhase phase);

// One applied decision, in order
struct Decision {
  int step{0};
  std::string role;
  std::string action;
  json arg;  // null when the action takes no argument

  bool operator==(const Decision& other) const {
    return step == other.step && role == other.role && action == other.action && arg == other.arg;
  }
};

class TurnStepper {
public:
  TurnStepper(rules::RulesEngine& engine, ChoiceProvider& choices, CrashReporter& reporter,
              const DriverConfig& config);

  TurnStepper(const TurnStepper&) = delete;
  TurnStepper& operator=(const TurnStepper&) = delete;

  // Enter Running with the given setup and initial state
  void Start(rules::GameSetup setup, json initial_state);

  // Execute one step. Returns true while the phase is still Running.
  // Throws FuzzError on findings, std::logic_error if not Running.
  bool Step();

  // Start() then Step() until a terminal phase.
  // Returns GameOver or InsufficientInput, throws FuzzError on findings.
  RunOutcome Run(rules::GameSetup setup, json initial_state);

  TurnPhase phase() const { return phase_; }
  int step() const { return step_; }
  const json& state() const { return state_; }
  const rules::GameSetup& setup() const { return setup_; }
  const std::vector<Decision>& decisions() const { return decisions_; }

private:
  std::optional<std::string> ResolveActiveRole();
  bool IsGameOver() const;

  [[noreturn]] void Fail(TurnPhase phase, FailureKind kind, const std::string& message, const json& view,
                         const std::string& active);

  // Must be called from inside the handler so the engine's exception is captured
  [[noreturn]] void FailRulesCrash(const json& view, const std::string& active, const std::string& action,
                                   const json& arg, const std::string& cause_message);

  rules::RulesEngine& engine_;
  ChoiceProvider& choices_;
  CrashReporter& reporter_;
  DriverConfig config_;

  TurnPhase phase_{TurnPhase::Init};
  rules::GameSetup setup_;
  json state_;
  int step_{0};
  std::vector<Decision> decisions_;
};

}  // namespace driver
}  // namespace rttfuzz

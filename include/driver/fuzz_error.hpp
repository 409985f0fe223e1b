// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace rttfuzz {
namespace driver {

// Fatal classifications. Each ends the run and is reported as a finding.
enum class FailureKind {
  BoundExceeded,          // step counter went past max_steps (likely a non-terminating loop)
  NoActionsAvailable,     // game not over but nothing can be chosen (dead end)
  InvalidActionArgument,  // argument pool contains NaN (rules authoring bug)
  RulesEngineFailure,     // Action()/Resign() threw
};

const char* FailureKindName(FailureKind kind);

// Non-error end of a run
enum class RunOutcome {
  GameOver,           // state reached "game_over"
  InsufficientInput,  // fuzz input too short to continue; not a finding
};

const char* RunOutcomeName(RunOutcome outcome);

class FuzzError : public std::runtime_error {
public:
  FuzzError(FailureKind kind, const std::string& message, int step, std::string active);

  // RulesEngineFailure wrapping the exception thrown by the engine
  FuzzError(const std::string& message, int step, std::string active, std::string cause_message,
            std::exception_ptr cause);

  FailureKind kind() const { return kind_; }
  int step() const { return step_; }
  const std::string& active() const { return active_; }

  // Only set for RulesEngineFailure
  const std::optional<std::string>& cause_message() const { return cause_message_; }
  std::exception_ptr cause() const { return cause_; }

private:
  FailureKind kind_;
  int step_;
  std::string active_;
  std::optional<std::string> cause_message_;
  std::exception_ptr cause_;
};

}  // namespace driver
}  // namespace rttfuzz

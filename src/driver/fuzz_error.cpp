// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/fuzz_error.hpp"

#include <utility>

namespace rttfuzz {
namespace driver {

const char* FailureKindName(FailureKind kind) {
  switch (kind) {
  case FailureKind::BoundExceeded:
    return "BoundExceeded";
  case FailureKind::NoActionsAvailable:
    return "NoActionsAvailable";
  case FailureKind::InvalidActionArgument:
    return "InvalidActionArgument";
  case FailureKind::RulesEngineFailure:
    return "RulesEngineFailure";
  }
  return "Unknown";
}

const char* RunOutcomeName(RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::GameOver:
    return "GameOver";
  case RunOutcome::InsufficientInput:
    return "InsufficientInput";
  }
  return "Unknown";
}

FuzzError::FuzzError(FailureKind kind, const std::string& message, int step, std::string active)
    : std::runtime_error(std::string(FailureKindName(kind)) + ": " + message),
      kind_(kind),
      step_(step),
      active_(std::move(active)) {}

FuzzError::FuzzError(const std::string& message, int step, std::string active, std::string cause_message,
                     std::exception_ptr cause)
    : std::runtime_error(std::string(FailureKindName(FailureKind::RulesEngineFailure)) + ": " + message + ": " +
                         cause_message),
      kind_(FailureKind::RulesEngineFailure),
      step_(step),
      active_(std::move(active)),
      cause_message_(std::move(cause_message)),
      cause_(std::move(cause)) {}

}  // namespace driver
}  // namespace rttfuzz

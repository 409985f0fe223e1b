// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/turn_stepper.hpp"

#include "util/logging.hpp"

#include <stdexcept>
#include <utility>

namespace rttfuzz {
namespace driver {

namespace {

std::string role_of(const json& state) {
  if (!state.is_object()) {
    return "";
  }
  auto it = state.find("active");
  if (it == state.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // anonymous namespace

const char* TurnPhaseName(TurnPhase phase) {
  switch (phase) {
  case TurnPhase::Init:
    return "INIT";
  case TurnPhase::Running:
    return "RUNNING";
  case TurnPhase::GameOver:
    return "GAME_OVER";
  case TurnPhase::BoundExceeded:
    return "BOUND_EXCEEDED";
  case TurnPhase::NoActions:
    return "NO_ACTIONS";
  case TurnPhase::InvalidArg:
    return "INVALID_ARG";
  case TurnPhase::RulesCrash:
    return "RULES_CRASH";
  case TurnPhase::InsufficientInput:
    return "INSUFFICIENT_INPUT";
  }
  return "UNKNOWN";
}

TurnStepper::TurnStepper(rules::RulesEngine& engine, ChoiceProvider& choices, CrashReporter& reporter,
                         const DriverConfig& config)
    : engine_(engine), choices_(choices), reporter_(reporter), config_(config) {}

void TurnStepper::Start(rules::GameSetup setup, json initial_state) {
  if (phase_ != TurnPhase::Init) {
    throw std::logic_error("TurnStepper::Start called twice");
  }
  setup_ = std::move(setup);
  state_ = std::move(initial_state);
  step_ = 0;
  phase_ = TurnPhase::Running;
}

RunOutcome TurnStepper::Run(rules::GameSetup setup, json initial_state) {
  Start(std::move(setup), std::move(initial_state));
  while (Step()) {
  }
  return phase_ == TurnPhase::GameOver ? RunOutcome::GameOver : RunOutcome::InsufficientInput;
}

std::optional<std::string> TurnStepper::ResolveActiveRole() {
  std::string active = role_of(state_);
  if (active != rules::ACTIVE_BOTH && active != rules::ACTIVE_ALL) {
    return active;
  }
  // Several roles may act: the fuzz input decides who goes first
  return choices_.PickOne(engine_.Roles());
}

bool TurnStepper::IsGameOver() const {
  if (!state_.is_object()) {
    return false;
  }
  auto it = state_.find("state");
  return it != state_.end() && it->is_string() && it->get_ref<const std::string&>() == rules::STATE_GAME_OVER;
}

void TurnStepper::Fail(TurnPhase phase, FailureKind kind, const std::string& message, const json& view,
                       const std::string& active) {
  reporter_.Report(CrashContext{setup_, state_, view, step_, active, std::nullopt, std::nullopt});
  phase_ = phase;
  LOG_DRIVER_ERROR("{} at step {} (active={}): {}", FailureKindName(kind), step_, active, message);
  throw FuzzError(kind, message, step_, active);
}

void TurnStepper::FailRulesCrash(const json& view, const std::string& active, const std::string& action,
                                 const json& arg, const std::string& cause_message) {
  reporter_.Report(CrashContext{setup_, state_, view, step_, active, action, arg});
  phase_ = TurnPhase::RulesCrash;
  LOG_DRIVER_ERROR("RulesEngineFailure at step {} (active={} action={}): {}", step_, active, action, cause_message);
  throw FuzzError("action '" + action + "' failed", step_, active, cause_message, std::current_exception());
}

bool TurnStepper::Step() {
  if (phase_ != TurnPhase::Running) {
    throw std::logic_error(std::string("TurnStepper::Step called in phase ") + TurnPhaseName(phase_));
  }

  if (!choices_.HasMinimumBytes(config_.min_input_bytes)) {
    LOG_DRIVER_TRACE("Input exhausted at step {} ({} bytes left)", step_, choices_.RemainingBytes());
    phase_ = TurnPhase::InsufficientInput;
    return false;
  }

  auto resolved = ResolveActiveRole();
  if (!resolved) {
    LOG_DRIVER_TRACE("No role to pick from at step {}", step_);
    phase_ = TurnPhase::InsufficientInput;
    return false;
  }
  const std::string active = *resolved;

  const json view = engine_.View(state_, active);

  if (step_ > config_.max_steps) {
    Fail(TurnPhase::BoundExceeded, FailureKind::BoundExceeded,
         "Maximum step count (MAX_STEPS=" + std::to_string(config_.max_steps) + ") exceeded", view, active);
  }

  if (IsGameOver()) {
    LOG_DRIVER_DEBUG("Game over after {} steps", step_);
    phase_ = TurnPhase::GameOver;
    return false;
  }

  if (!HasActionsField(view)) {
    Fail(TurnPhase::NoActions, FailureKind::NoActionsAvailable, "No actions defined", view, active);
  }

  NormalizeOptions options;
  options.drop_undo = config_.no_undo;
  options.inject_resign = !config_.no_resign && engine_.SupportsResign();
  const std::vector<NormalizedAction> actions = NormalizeActions(view.at("actions"), options);

  if (actions.empty()) {
    Fail(TurnPhase::NoActions, FailureKind::NoActionsAvailable, "No more actions to take (besides undo)", view,
         active);
  }

  const NormalizedAction& chosen = actions[*choices_.PickIndex(actions.size())];

  json arg;
  if (chosen.descriptor.kind == ActionDescriptor::Kind::ArgumentPool) {
    if (FindNaNArgument(chosen.descriptor)) {
      Fail(TurnPhase::InvalidArg, FailureKind::InvalidActionArgument,
           "Action '" + chosen.name + "' argument has NaN value", view, active);
    }
    arg = chosen.descriptor.pool[*choices_.PickIndex(chosen.descriptor.pool.size())];
  }

  LOG_DRIVER_TRACE("step={} active={} action={} arg={}", step_, active, chosen.name,
                   arg.dump(-1, ' ', false, json::error_handler_t::replace));

  // Observation only; its errors are not rules crashes and propagate as-is
  if (engine_.HasFuzzLog()) {
    engine_.FuzzLog(json{{"state", state_},
                         {"view", view},
                         {"actions", ActionNames(actions)},
                         {"chosen_action", chosen.name},
                         {"args", chosen.descriptor.raw},
                         {"chosen_arg", arg}});
  }

  try {
    if (chosen.name == RESIGN_ACTION) {
      state_ = engine_.Resign(state_, active);
    } else {
      state_ = engine_.Action(state_, active, chosen.name, arg);
    }
  } catch (const std::exception& e) {
    FailRulesCrash(view, active, chosen.name, arg, e.what());
  } catch (...) {
    FailRulesCrash(view, active, chosen.name, arg, "non-standard exception");
  }

  decisions_.push_back(Decision{step_, active, chosen.name, arg});
  ++step_;
  return true;
}

}  // namespace driver
}  // namespace rttfuzz

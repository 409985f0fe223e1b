// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rules/rules_engine.hpp"

#include <stdexcept>

namespace rttfuzz {
namespace rules {

json RulesEngine::Resign(const json& state, const std::string& role) {
  (void)state;
  throw std::logic_error("rules engine does not support resignation (role " + role + ")");
}

}  // namespace rules
}  // namespace rttfuzz

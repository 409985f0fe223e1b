// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TicTacToeRules - small reference engine for exercising the driver

 Roles X and O. Scenarios:
 - Standard  three in a row wins
 - Misere    three in a row loses
 The seed decides who moves first. Actions offered to the active role:
 - place  pool of free cells (0..8)
 - undo   1 when there is a move to take back, 0 otherwise
 Resignation is supported.
*/

#include "rules/rules_engine.hpp"

#include <string>
#include <vector>

namespace rttfuzz {
namespace rules {

class TicTacToeRules : public RulesEngine {
public:
  static constexpr int BOARD_CELLS = 9;

  TicTacToeRules();

  const std::vector<std::string>& Roles() const override { return roles_; }
  const std::vector<std::string>& Scenarios() const override { return scenarios_; }

  json Setup(int64_t seed, const std::string& scenario, const json& options) override;
  json View(const json& state, const std::string& role) override;
  json Action(const json& state, const std::string& role, const std::string& action, const json& arg) override;

  bool SupportsResign() const override { return true; }
  json Resign(const json& state, const std::string& role) override;

  // "X", "O", or empty if no line is complete
  static std::string LineOwner(const json& board);

private:
  std::vector<std::string> roles_;
  std::vector<std::string> scenarios_;
};

}  // namespace rules
}  // namespace rttfuzz

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RulesEngine - interface between the fuzz driver and a game's rules

 The driver never interprets game logic. It only reads three fields:
 - state["active"]  role that may act, or "Both"/"All" when several may
 - state["state"]   "game_over" marks the end of the game
 - view["actions"]  action name -> argument descriptor

 Game state is opaque to the driver and replaced wholesale by every call to
 Action() or Resign(). Both may throw; the driver classifies any exception
 as a rules engine failure.
*/

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rttfuzz {
namespace rules {

using json = nlohmann::json;

// Sentinels used in state["active"] when more than one role may act
inline constexpr const char* ACTIVE_BOTH = "Both";
inline constexpr const char* ACTIVE_ALL = "All";

// Value of state["state"] once the game has ended
inline constexpr const char* STATE_GAME_OVER = "game_over";

// Fixed at run start from the first decisions drawn
struct GameSetup {
  int64_t seed{0};
  std::string scenario;
  json options = json::object();
};

class RulesEngine {
public:
  virtual ~RulesEngine() = default;

  virtual const std::vector<std::string>& Roles() const = 0;
  virtual const std::vector<std::string>& Scenarios() const = 0;

  virtual json Setup(int64_t seed, const std::string& scenario, const json& options) = 0;

  virtual json View(const json& state, const std::string& role) = 0;

  // arg is null when the chosen action takes no argument
  virtual json Action(const json& state, const std::string& role, const std::string& action, const json& arg) = 0;

  // Engines that support resignation override both
  virtual bool SupportsResign() const { return false; }
  virtual json Resign(const json& state, const std::string& role);

  // Observation hook called before every applied action. Must not modify game state.
  virtual bool HasFuzzLog() const { return false; }
  virtual void FuzzLog(const json& context) { (void)context; }
};

}  // namespace rules
}  // namespace rttfuzz

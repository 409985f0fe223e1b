// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <string>

namespace rttfuzz {
namespace driver {

struct DriverConfig {
  static constexpr int DEFAULT_MAX_STEPS = 2048;
  static constexpr size_t DEFAULT_MIN_INPUT_BYTES = 16;

  std::string rules_path{"rules.so"};            // RTT_RULES
  int max_steps{DEFAULT_MAX_STEPS};              // MAX_STEPS
  bool no_undo{false};                           // NO_UNDO: hide "undo" to surface dead ends
  bool no_resign{false};                         // NO_RESIGN: never offer _resign
  bool random{false};                            // RND: ignore input bytes, draw from a PRNG
  size_t min_input_bytes{DEFAULT_MIN_INPUT_BYTES};
  std::string crash_state_path{"crash-state.json"};  // RTT_CRASH_STATE
  std::string log_level{"info"};                 // RTT_LOGLEVEL

  // Defaults overridden by the process environment
  static DriverConfig FromEnvironment();

  // One-line summary for the startup banner
  std::string Describe() const;
};

// Positive integer or fallback. Accepts leading digits ("12abc" -> 12).
int ParseMaxSteps(const char* text, int fallback = DriverConfig::DEFAULT_MAX_STEPS);

// Only the exact string "true" enables a flag
bool ParseFlag(const char* text);

}  // namespace driver
}  // namespace rttfuzz

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "rules/rules_engine.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace rttfuzz {
namespace driver {

using json = nlohmann::json;

// Everything known about the step that failed
struct CrashContext {
  const rules::GameSetup& setup;
  const json& state;
  const json& view;
  int step;
  const std::string& active;
  std::optional<std::string> action;  // set once an action was chosen
  std::optional<json> arg;            // set together with action
};

/**
 * Writes failure evidence before a fatal classification propagates.
 *
 * The view and a one-line step summary go to the diagnostic stream; the game
 * state is written as JSON to a fixed path, replacing any earlier snapshot.
 * Report() never throws.
 */
class CrashReporter {
public:
  static constexpr const char* DEFAULT_STATE_PATH = "crash-state.json";

  explicit CrashReporter(std::filesystem::path state_path = DEFAULT_STATE_PATH, std::ostream& out = std::cout);

  void Report(const CrashContext& context) noexcept;

  const std::filesystem::path& state_path() const { return state_path_; }

  // Number of reports written by this instance
  size_t reports() const { return reports_; }

private:
  std::filesystem::path state_path_;
  std::ostream& out_;
  size_t reports_{0};
};

// Load a snapshot written by Report(). nullopt if missing or not valid JSON.
std::optional<json> LoadCrashState(const std::filesystem::path& path);

}  // namespace driver
}  // namespace rttfuzz

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "driver/driver_config.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace rttfuzz {
namespace driver {

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

}  // anonymous namespace

int ParseMaxSteps(const char* text, int fallback) {
  if (!text) {
    return fallback;
  }
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (end == text || errno == ERANGE || value <= 0 || value > INT_MAX) {
    return fallback;
  }
  return static_cast<int>(value);
}

bool ParseFlag(const char* text) {
  return text && std::strcmp(text, "true") == 0;
}

DriverConfig DriverConfig::FromEnvironment() {
  DriverConfig config;
  if (const char* rules = env("RTT_RULES")) {
    config.rules_path = rules;
  }
  config.max_steps = ParseMaxSteps(env("MAX_STEPS"));
  config.no_undo = ParseFlag(env("NO_UNDO"));
  config.no_resign = ParseFlag(env("NO_RESIGN"));
  config.random = ParseFlag(env("RND"));
  if (const char* path = env("RTT_CRASH_STATE")) {
    config.crash_state_path = path;
  }
  if (const char* level = env("RTT_LOGLEVEL")) {
    config.log_level = level;
  }
  return config;
}

std::string DriverConfig::Describe() const {
  std::ostringstream ss;
  ss << "RTT_RULES='" << rules_path << "' MAX_STEPS=" << max_steps << " RANDOM='" << (random ? "true" : "false")
     << "' NO_UNDO='" << (no_undo ? "true" : "false") << "' NO_RESIGN='" << (no_resign ? "true" : "false")
     << "' CRASH_STATE='" << crash_state_path << "'";
  return ss.str();
}

}  // namespace driver
}  // namespace rttfuzz

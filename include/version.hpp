// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#define RTTFUZZ_VERSION_MAJOR 0
#define RTTFUZZ_VERSION_MINOR 3
#define RTTFUZZ_VERSION_PATCH 0

namespace rttfuzz {

inline std::string GetVersionString() {
  return std::to_string(RTTFUZZ_VERSION_MAJOR) + "." + std::to_string(RTTFUZZ_VERSION_MINOR) + "." +
         std::to_string(RTTFUZZ_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "rttfuzz version v" + GetVersionString();
}

}  // namespace rttfuzz

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "rules/rules_engine.hpp"

#include <memory>
#include <string>

// Entry points a rules module must export with C linkage
#define RTTFUZZ_CREATE_RULES_SYMBOL "rttfuzz_create_rules_engine"
#define RTTFUZZ_DESTROY_RULES_SYMBOL "rttfuzz_destroy_rules_engine"

extern "C" {
typedef rttfuzz::rules::RulesEngine* (*rttfuzz_create_rules_fn)();
typedef void (*rttfuzz_destroy_rules_fn)(rttfuzz::rules::RulesEngine*);
}

namespace rttfuzz {
namespace rules {

/**
 * Rules module loaded from a shared object (POSIX dlopen)
 *
 * Owns both the library handle and the engine it created. The engine is
 * destroyed through the module's own destroy function before the handle is
 * closed.
 */
class RulesLibrary {
public:
  // Load module and create its engine. Throws std::runtime_error on failure.
  static std::unique_ptr<RulesLibrary> Open(const std::string& path);

  ~RulesLibrary();

  RulesLibrary(const RulesLibrary&) = delete;
  RulesLibrary& operator=(const RulesLibrary&) = delete;

  RulesEngine& engine() { return *engine_; }
  const std::string& path() const { return path_; }

private:
  RulesLibrary(std::string path, void* handle, RulesEngine* engine, rttfuzz_destroy_rules_fn destroy);

  std::string path_;
  void* handle_{nullptr};
  RulesEngine* engine_{nullptr};
  rttfuzz_destroy_rules_fn destroy_{nullptr};
};

}  // namespace rules
}  // namespace rttfuzz

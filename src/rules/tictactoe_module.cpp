// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Loadable module exposing TicTacToeRules to RulesLibrary::Open()

#include "rules/rules_library.hpp"
#include "rules/tictactoe_rules.hpp"

extern "C" rttfuzz::rules::RulesEngine* rttfuzz_create_rules_engine() {
  return new rttfuzz::rules::TicTacToeRules();
}

extern "C" void rttfuzz_destroy_rules_engine(rttfuzz::rules::RulesEngine* engine) {
  delete engine;
}

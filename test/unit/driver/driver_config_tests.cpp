// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for DriverConfig environment parsing

#include <catch2/catch_test_macros.hpp>

#include "driver/driver_config.hpp"
#include <cstdlib>
#include <string>

using namespace rttfuzz::driver;

namespace {

const char* const kVariables[] = {"RTT_RULES", "MAX_STEPS", "NO_UNDO", "NO_RESIGN",
                                  "RND", "RTT_CRASH_STATE", "RTT_LOGLEVEL"};

// Clears the driver's variables on entry and exit
class EnvironmentGuard {
public:
    EnvironmentGuard() { Clear(); }
    ~EnvironmentGuard() { Clear(); }

    void Set(const char* name, const char* value) { setenv(name, value, 1); }

private:
    static void Clear() {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
    }
};

}  // namespace

TEST_CASE("DriverConfig: defaults", "[config]") {
    EnvironmentGuard env;
    auto config = DriverConfig::FromEnvironment();

    REQUIRE(config.rules_path == "rules.so");
    REQUIRE(config.max_steps == 2048);
    REQUIRE_FALSE(config.no_undo);
    REQUIRE_FALSE(config.no_resign);
    REQUIRE_FALSE(config.random);
    REQUIRE(config.min_input_bytes == 16);
    REQUIRE(config.crash_state_path == "crash-state.json");
    REQUIRE(config.log_level == "info");
}

TEST_CASE("DriverConfig: environment overrides", "[config]") {
    EnvironmentGuard env;
    env.Set("RTT_RULES", "/opt/games/rules.so");
    env.Set("MAX_STEPS", "300");
    env.Set("NO_UNDO", "true");
    env.Set("NO_RESIGN", "true");
    env.Set("RND", "true");
    env.Set("RTT_CRASH_STATE", "/tmp/state.json");
    env.Set("RTT_LOGLEVEL", "debug");

    auto config = DriverConfig::FromEnvironment();
    REQUIRE(config.rules_path == "/opt/games/rules.so");
    REQUIRE(config.max_steps == 300);
    REQUIRE(config.no_undo);
    REQUIRE(config.no_resign);
    REQUIRE(config.random);
    REQUIRE(config.crash_state_path == "/tmp/state.json");
    REQUIRE(config.log_level == "debug");

    auto summary = config.Describe();
    REQUIRE(summary.find("MAX_STEPS=300") != std::string::npos);
    REQUIRE(summary.find("NO_UNDO='true'") != std::string::npos);
}

TEST_CASE("DriverConfig: flags need the exact string true", "[config]") {
    EnvironmentGuard env;
    env.Set("NO_UNDO", "1");
    env.Set("NO_RESIGN", "TRUE");
    env.Set("RND", "yes");

    auto config = DriverConfig::FromEnvironment();
    REQUIRE_FALSE(config.no_undo);
    REQUIRE_FALSE(config.no_resign);
    REQUIRE_FALSE(config.random);
}

TEST_CASE("ParseMaxSteps", "[config]") {
    REQUIRE(ParseMaxSteps(nullptr) == 2048);
    REQUIRE(ParseMaxSteps("") == 2048);
    REQUIRE(ParseMaxSteps("abc") == 2048);
    REQUIRE(ParseMaxSteps("0") == 2048);
    REQUIRE(ParseMaxSteps("-5") == 2048);
    REQUIRE(ParseMaxSteps("99999999999999999999") == 2048);
    REQUIRE(ParseMaxSteps("64") == 64);
    REQUIRE(ParseMaxSteps("128steps") == 128);
    REQUIRE(ParseMaxSteps("junk", 10) == 10);
}

TEST_CASE("ParseFlag", "[config]") {
    REQUIRE(ParseFlag("true"));
    REQUIRE_FALSE(ParseFlag(nullptr));
    REQUIRE_FALSE(ParseFlag("false"));
    REQUIRE_FALSE(ParseFlag("true "));
}

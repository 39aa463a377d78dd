#pragma once

#include "crash.hpp"
#include "fixed_point.hpp"
#include "log.hpp"

#include <functional>
#include <string>

namespace hb {

struct ServiceConfig {
    std::string defaultPlayerSeed = "client";
    Amount startingBalance = 100'000; // 1000.00
    LogLevel logLevel = LogLevel::Info;
    CrashConfig crash;
};

// Returns nullptr for unset variables.
using EnvLookup = std::function<const char*(const char*)>;

// Defaults overridden by HB_DEFAULT_PLAYER_SEED, HB_STARTING_BALANCE (minor
// units), HB_CRASH_TICK_MS, HB_CRASH_DELAY_MS and HB_LOG_LEVEL. Values are
// trimmed; malformed ones throw std::runtime_error naming the variable.
ServiceConfig loadConfig(const EnvLookup& lookup);
ServiceConfig loadConfigFromEnv();

std::string trim(const std::string& value);

} // namespace hb

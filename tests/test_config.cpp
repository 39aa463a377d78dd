#include "config.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace hb;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "config_test failure: " << msg << std::endl;
    std::exit(1);
}

EnvLookup lookupIn(const std::map<std::string, std::string>& env) {
    return [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };
}

bool rejects(const std::map<std::string, std::string>& env) {
    try {
        loadConfig(lookupIn(env));
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

std::vector<std::string> gCaptured;

void captureSink(LogLevel level, const char* tag, const std::string& text) {
    gCaptured.push_back(std::string(toString(level)) + " " + tag + " " + text);
}

} // namespace

int main() {
    std::map<std::string, std::string> empty;
    auto defaults = loadConfig(lookupIn(empty));
    if (defaults.defaultPlayerSeed != "client" || defaults.startingBalance != 100'000 ||
        defaults.logLevel != LogLevel::Info || defaults.crash.tickInterval.count() != 200 ||
        defaults.crash.interRoundDelay.count() != 3000) {
        fail("defaults changed");
    }

    std::map<std::string, std::string> env{
        { "HB_DEFAULT_PLAYER_SEED", "  lucky  " },
        { "HB_STARTING_BALANCE", "2500\n" },
        { "HB_CRASH_TICK_MS", " 100" },
        { "HB_CRASH_DELAY_MS", "0" },
        { "HB_LOG_LEVEL", "debug" },
    };
    auto cfg = loadConfig(lookupIn(env));
    if (cfg.defaultPlayerSeed != "lucky" || cfg.startingBalance != 2500 || cfg.crash.tickInterval.count() != 100 ||
        cfg.crash.interRoundDelay.count() != 0 || cfg.logLevel != LogLevel::Debug) {
        fail("overrides not applied");
    }

    if (!rejects({ { "HB_DEFAULT_PLAYER_SEED", "   " } }) || !rejects({ { "HB_STARTING_BALANCE", "-5" } }) ||
        !rejects({ { "HB_STARTING_BALANCE", "12abc" } }) || !rejects({ { "HB_CRASH_TICK_MS", "0" } }) ||
        !rejects({ { "HB_CRASH_DELAY_MS", "" } }) || !rejects({ { "HB_LOG_LEVEL", "loud" } })) {
        fail("malformed values must be refused");
    }

    if (trim(" \t x y \r\n") != "x y" || !trim("   ").empty()) {
        fail("trim broken");
    }

    Log::setSink(&captureSink);
    Log::setLevel(LogLevel::Warning);
    Log::info("test", "hidden");
    Log::warning("test", "shown ", 42);
    Log::error("test", 'x', 1.5);
    Log::setSink(nullptr);
    Log::setLevel(LogLevel::Info);
    if (gCaptured.size() != 2 || gCaptured[0] != "warning test shown 42" || gCaptured[1] != "error test x1.5") {
        fail("log level filtering or formatting broken");
    }

    std::cout << "Config checks passed\n";
    return 0;
}

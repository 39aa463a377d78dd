#include "config.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace hb {

namespace {

std::int64_t parseInteger(const char* name, const std::string& text, std::int64_t min, std::int64_t max) {
    if (text.empty()) {
        throw std::runtime_error(std::string(name) + " is empty or whitespace");
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        throw std::runtime_error(std::string(name) + " must be an integer, got \"" + text + "\"");
    }
    if (value < min || value > max) {
        throw std::runtime_error(std::string(name) + " must lie in [" + std::to_string(min) + ", " +
                                 std::to_string(max) + "]");
    }
    return static_cast<std::int64_t>(value);
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

ServiceConfig loadConfig(const EnvLookup& lookup) {
    ServiceConfig cfg;

    if (const char* raw = lookup("HB_DEFAULT_PLAYER_SEED")) {
        std::string seed = trim(raw);
        if (seed.empty()) {
            throw std::runtime_error("HB_DEFAULT_PLAYER_SEED is empty or whitespace");
        }
        if (seed.size() > 256) {
            throw std::runtime_error("HB_DEFAULT_PLAYER_SEED is longer than 256 characters");
        }
        cfg.defaultPlayerSeed = seed;
    }
    if (const char* raw = lookup("HB_STARTING_BALANCE")) {
        cfg.startingBalance = parseInteger("HB_STARTING_BALANCE", trim(raw), 0, 1'000'000'000'000LL);
    }
    if (const char* raw = lookup("HB_CRASH_TICK_MS")) {
        cfg.crash.tickInterval =
            std::chrono::milliseconds(parseInteger("HB_CRASH_TICK_MS", trim(raw), 10, 60'000));
    }
    if (const char* raw = lookup("HB_CRASH_DELAY_MS")) {
        cfg.crash.interRoundDelay =
            std::chrono::milliseconds(parseInteger("HB_CRASH_DELAY_MS", trim(raw), 0, 600'000));
    }
    if (const char* raw = lookup("HB_LOG_LEVEL")) {
        try {
            cfg.logLevel = parseLogLevel(trim(raw));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("HB_LOG_LEVEL: ") + e.what());
        }
    }
    return cfg;
}

ServiceConfig loadConfigFromEnv() {
    return loadConfig([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace hb

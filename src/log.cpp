#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>

namespace hb {

namespace {

std::atomic<Log::Sink> gSink{ nullptr };
std::atomic<int> gLevel{ static_cast<int>(LogLevel::Info) };
std::mutex gStdMutex;

char levelLetter(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return 'D';
    case LogLevel::Info:
        return 'I';
    case LogLevel::Warning:
        return 'W';
    case LogLevel::Error:
        return 'E';
    }
    return '?';
}

void stdLog(LogLevel level, const char* tag, const std::string& text) {
    char timeBuf[32];
    const std::time_t t = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&t, &utc);
    if (std::strftime(timeBuf, sizeof(timeBuf), "%F %T", &utc) == 0) {
        timeBuf[0] = '\0';
    }

    FILE* out = level >= LogLevel::Warning ? stderr : stdout;
    std::lock_guard<std::mutex> lock(gStdMutex);
    std::fprintf(out, "%s %c/%s: %s\n", timeBuf, levelLetter(level), tag, text.c_str());
    std::fflush(out);
}

} // namespace

LogLevel parseLogLevel(const std::string& text) {
    if (text == "debug") {
        return LogLevel::Debug;
    }
    if (text == "info") {
        return LogLevel::Info;
    }
    if (text == "warning" || text == "warn") {
        return LogLevel::Warning;
    }
    if (text == "error") {
        return LogLevel::Error;
    }
    throw std::invalid_argument("unknown log level: " + text);
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

void Log::setSink(Sink sink) {
    gSink.store(sink);
}

void Log::setLevel(LogLevel level) {
    gLevel.store(static_cast<int>(level));
}

LogLevel Log::level() {
    return static_cast<LogLevel>(gLevel.load());
}

bool Log::enabled(LogLevel level) {
    return static_cast<int>(level) >= gLevel.load();
}

void Log::write(LogLevel level, const char* tag, const std::string& text) {
    if (!enabled(level)) {
        return;
    }
    Sink sink = gSink.load();
    if (sink != nullptr) {
        sink(level, tag, text);
    } else {
        stdLog(level, tag, text);
    }
}

} // namespace hb

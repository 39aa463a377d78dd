#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace hb {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

LogLevel parseLogLevel(const std::string& text);
const char* toString(LogLevel level);

// Tagged process-wide logger. Lines go to stdout (debug/info) or stderr
// (warning/error) unless a sink is installed.
class Log {
public:
    using Sink = void (*)(LogLevel level, const char* tag, const std::string& text);

    static void setSink(Sink sink);
    static void setLevel(LogLevel level);
    static LogLevel level();

    static void write(LogLevel level, const char* tag, const std::string& text);

    template <typename... Ts>
    static void debug(const char* tag, Ts&&... parts) {
        emit(LogLevel::Debug, tag, std::forward<Ts>(parts)...);
    }
    template <typename... Ts>
    static void info(const char* tag, Ts&&... parts) {
        emit(LogLevel::Info, tag, std::forward<Ts>(parts)...);
    }
    template <typename... Ts>
    static void warning(const char* tag, Ts&&... parts) {
        emit(LogLevel::Warning, tag, std::forward<Ts>(parts)...);
    }
    template <typename... Ts>
    static void error(const char* tag, Ts&&... parts) {
        emit(LogLevel::Error, tag, std::forward<Ts>(parts)...);
    }

private:
    static bool enabled(LogLevel level);

    template <typename... Ts>
    static void emit(LogLevel level, const char* tag, Ts&&... parts) {
        if (!enabled(level)) {
            return;
        }
        std::ostringstream oss;
        (oss << ... << std::forward<Ts>(parts));
        write(level, tag, oss.str());
    }
};

} // namespace hb

#pragma once
#include <optional>
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

class Log {
public:
    static void setLevel(LogLevel level);
    static bool enabled(LogLevel level);

    // "debug" / "info" / "warn" / "warning" / "error", any case
    static std::optional<LogLevel> parseLevel(const std::string& name);

    // [<ms>ms][TID <id>][LEVEL][tag] msg
    static void write(LogLevel level, const std::string& tag, const std::string& msg);
};

#define LOGX(level, tag, msg)                                  \
    do {                                                       \
        if (Log::enabled(level)) {                             \
            std::ostringstream logx_oss_;                      \
            logx_oss_ << msg;                                  \
            Log::write(level, tag, logx_oss_.str());           \
        }                                                      \
    } while (0)

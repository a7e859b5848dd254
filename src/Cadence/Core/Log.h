#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Core/Json.h"

#include "Core/Scalar.h"
#include "Helper/Time.h"

enum class LogLevel {
    Trace = 5,
    Debug = 10,
    Info = 20,
    Warning = 30,
    Error = 40,
    Critical = 50,
};

JsonEnum(
    LogLevel,
    {
        {LogLevel::Trace, "Trace"},
        {LogLevel::Debug, "Debug"},
        {LogLevel::Info, "Info"},
        {LogLevel::Warning, "Warning"},
        {LogLevel::Error, "Error"},
        {LogLevel::Critical, "Critical"},
    }
)

constexpr std::string_view LogLevelToString(LogLevel level) {
    using enum LogLevel;
    switch (level) {
        case Trace: return "Trace";
        case Debug: return "Debug";
        case Info: return "Info";
        case Warning: return "Warning";
        case Error: return "Error";
        case Critical: return "Critical";
    }
    return "";
}

struct LogContext {
    std::string File;
    u32 Line;

    LogContext(const std::string &file, u32 line)
        : File(file), Line(line) {}

    nlohmann::json ToJson() const {
        return {
            {"File", File},
            {"Line", Line},
        };
    }
};

struct MessageMoment {
    std::string Message;
    LogContext Context;
    TimePoint Time;

    MessageMoment(const std::string &message, const LogContext &context, TimePoint time)
        : Message(message), Context(context), Time(time) {}

    nlohmann::json ToJson() const;
};

/**
Messages at or above `Level` are kept in memory, grouped by level, and exported with `ToJson`.
With `Echo` set, kept messages are also written to stderr as they arrive.
The core never writes anywhere else.
*/
class Log {
    std::map<LogLevel, std::vector<MessageMoment>> MessagesByLevel;
    LogLevel Level;
    bool Echo{false};

public:
    Log(LogLevel level) : Level(level) {}

    LogLevel GetLevel() const { return Level; }
    void SetLevel(LogLevel level) { Level = level; }
    void SetEcho(bool echo) { Echo = echo; }

    void LogMessage(LogLevel, const std::string &message, const LogContext &);
    void LogMessage(LogLevel level, const std::function<std::string()> &callable, const LogContext &context) {
        if (level >= Level) LogMessage(level, callable(), context);
    }

    const std::vector<MessageMoment> &Messages(LogLevel level) const;
    void Clear() { MessagesByLevel.clear(); }

    nlohmann::json ToJson() const;
};

extern Log Logger;

// The following macros log to the global `Logger`, capturing the call site.
#define Log(level, message) Logger.LogMessage(level, message, LogContext(__FILE__, __LINE__))
#define LogIf(level, callable) Logger.LogMessage(level, std::function<std::string()>(callable), LogContext(__FILE__, __LINE__))

#include "Log.h"

#include <iostream>

Log Logger{LogLevel::Info};

nlohmann::json MessageMoment::ToJson() const {
    return {
        {"Message", Message},
        {"Context", Context.ToJson()},
        {"Time", std::format("{:%Y-%m-%d %T}", Time)},
    };
}

void Log::LogMessage(LogLevel level, const std::string &message, const LogContext &context) {
    if (level < Level) return;

    const auto &moment = MessagesByLevel[level].emplace_back(message, context, Clock::now());
    if (Echo) std::cerr << std::format("[{}] {} ({}:{})", LogLevelToString(level), moment.Message, moment.Context.File, moment.Context.Line) << '\n';
}

const std::vector<MessageMoment> &Log::Messages(LogLevel level) const {
    static const std::vector<MessageMoment> Empty{};
    if (const auto it = MessagesByLevel.find(level); it != MessagesByLevel.end()) return it->second;
    return Empty;
}

nlohmann::json Log::ToJson() const {
    nlohmann::json json;
    for (const auto &[level, messages] : MessagesByLevel) {
        for (const auto &message : messages) {
            json[std::string{LogLevelToString(level)}].push_back(message.ToJson());
        }
    }
    return json;
}

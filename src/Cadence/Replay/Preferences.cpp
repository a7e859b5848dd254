#include "Preferences.h"

#include <format>
#include <stdexcept>

#include "Helper/File.h"

Preferences Preferences::Load(const fs::path &path) {
    Preferences preferences;
    try {
        if (!fs::exists(FileIO::ExpandPath(path))) return preferences;

        const auto js = json::parse(FileIO::read(path));
        preferences.LogLevel = js.value("LogLevel", preferences.LogLevel);
        preferences.EchoLog = js.value("EchoLog", preferences.EchoLog);
        preferences.HistoryCapacity = js.value("HistoryCapacity", preferences.HistoryCapacity);
    } catch (const json::exception &e) {
        Log(::LogLevel::Warning, std::format("Ignoring invalid preferences file {}: {}", path.string(), e.what()));
        return {};
    } catch (const std::runtime_error &e) {
        Log(::LogLevel::Warning, std::format("Ignoring preferences file {}: {}", path.string(), e.what()));
        return {};
    }
    return preferences;
}

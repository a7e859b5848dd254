#pragma once

#include "App/Dispatcher.h"
#include "Core/Log.h"
#include "Helper/Path.h"

// Replay tool preferences, read from a JSON object. Missing keys keep their defaults.
struct Preferences {
    inline static const fs::path DefaultPath = fs::path(".cadence") / "Preferences.json";

    // Returns defaults if the file doesn't exist, or (with a logged warning) if it can't be read or isn't valid.
    static Preferences Load(const fs::path & = DefaultPath);

    DispatcherConfig GetDispatcherConfig() const { return {HistoryCapacity}; }

    ::LogLevel LogLevel{::LogLevel::Info};
    bool EchoLog{false};
    Count HistoryCapacity{256};
};

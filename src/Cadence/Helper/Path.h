#pragma once

#include <filesystem>

namespace fs = std::filesystem;

struct PathHash {
    auto operator()(const fs::path &p) const noexcept { return fs::hash_value(p); }
};

// Identifies an action or event type, e.g. "Playback/TogglePlay".
using TypePath = fs::path;

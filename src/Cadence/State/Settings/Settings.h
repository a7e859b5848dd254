#pragma once

#include <string>

#include "Core/Json.h"
#include "Core/Scalar.h"

enum class Theme {
    Light,
    Dark,
    System,
};

JsonEnum(
    Theme,
    {
        {Theme::Light, "Light"},
        {Theme::Dark, "Dark"},
        {Theme::System, "System"},
    }
)

struct PlayerSettings {
    u32 BitrateKbps{160}; // One of 96, 160, 320
    std::string Backend{"pulseaudio"};
    bool Gapless{true};

    bool operator==(const PlayerSettings &) const = default;
};

struct Settings {
    ::Theme Theme{::Theme::System};
    PlayerSettings Player{};

    bool operator==(const Settings &) const = default;
};

Json(PlayerSettings, BitrateKbps, Backend, Gapless);
Json(Settings, Theme, Player);

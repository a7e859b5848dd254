#pragma once

#include "Core/Json.h"

enum class RepeatMode {
    None,
    Song,
    Playlist,
};

JsonEnum(
    RepeatMode,
    {
        {RepeatMode::None, "None"},
        {RepeatMode::Song, "Song"},
        {RepeatMode::Playlist, "Playlist"},
    }
)

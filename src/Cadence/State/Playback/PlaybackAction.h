#pragma once

#include <vector>

#include "Core/Action/Action.h"
#include "Model/Song.h"

DefineActionType(
    Playback,
    DefineAction(Play);
    DefineAction(Pause);
    DefineAction(TogglePlay);
    DefineAction(Stop);
    DefineAction(Next);
    DefineAction(Previous);
    DefineAction(ToggleRepeat);
    DefineAction(Seek, u32 position_ms;);
    DefineAction(SetVolume, double value;);
    DefineAction(LoadSongs, std::vector<SongDescription> songs;);
    DefineAction(PlaySong, std::string id;);
    DefineAction(Queue, std::vector<SongDescription> songs;);
    DefineAction(Dequeue, std::vector<std::string> ids;);

    Json(Play);
    Json(Pause);
    Json(TogglePlay);
    Json(Stop);
    Json(Next);
    Json(Previous);
    Json(ToggleRepeat);
    Json(Seek, position_ms);
    Json(SetVolume, value);
    Json(LoadSongs, songs);
    Json(PlaySong, id);
    Json(Queue, songs);
    Json(Dequeue, ids);

    using Any = ActionVariant<Play, Pause, TogglePlay, Stop, Next, Previous, ToggleRepeat, Seek, SetVolume, LoadSongs, PlaySong, Queue, Dequeue>;
);

#pragma once

#include <string>

#include "Core/Event/Event.h"
#include "RepeatMode.h"

DefineEventType(
    Playback,
    DefineEvent(PlaybackPaused);
    DefineEvent(PlaybackResumed);
    DefineEvent(PlaybackStopped);
    DefineEvent(TrackChanged, std::string id;);
    DefineEvent(RepeatModeChanged, RepeatMode mode;);
    DefineEvent(TrackSeeked, u32 position_ms;);
    DefineEvent(VolumeSet, double value;);
    DefineEvent(PlaylistChanged);

    Json(PlaybackPaused);
    Json(PlaybackResumed);
    Json(PlaybackStopped);
    Json(TrackChanged, id);
    Json(RepeatModeChanged, mode);
    Json(TrackSeeked, position_ms);
    Json(VolumeSet, value);
    Json(PlaylistChanged);

    using Any = EventVariant<PlaybackPaused, PlaybackResumed, PlaybackStopped, TrackChanged, RepeatModeChanged, TrackSeeked, VolumeSet, PlaylistChanged>;
);

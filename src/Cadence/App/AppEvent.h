#pragma once

#include <string>

#include "State/Browser/BrowserEvent.h"
#include "State/Login/LoginEvent.h"
#include "State/Playback/PlaybackEvent.h"
#include "State/Selection/SelectionEvent.h"
#include "State/Settings/SettingsEvent.h"

DefineEventType(
    App,
    DefineEvent(Started);
    DefineEvent(Raised);
    DefineEvent(NotificationShown, std::string text;);
    DefineEvent(PlaylistCreatedNotificationShown, std::string id;);
    DefineEvent(NowPlayingShown);

    Json(Started);
    Json(Raised);
    Json(NotificationShown, text);
    Json(PlaylistCreatedNotificationShown, id);
    Json(NowPlayingShown);

    using Any = EventVariant<Started, Raised, NotificationShown, PlaylistCreatedNotificationShown, NowPlayingShown>;
);

namespace Event {
using Any = MessageGroup<
    Playback::Any,
    Browser::Any,
    Selection::Any,
    Login::Any,
    Settings::Any,
    App::Any>;
} // namespace Event

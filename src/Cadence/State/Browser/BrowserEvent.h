#pragma once

#include <string>

#include "Core/Event/Event.h"
#include "Model/ScreenName.h"

DefineEventType(
    Browser,
    DefineEvent(NavigationPushed, ScreenName screen;);
    DefineEvent(NavigationPopped);
    DefineEvent(NavigationPoppedTo, ScreenName screen;);
    DefineEvent(SearchUpdated, std::string query;);
    DefineEvent(SavedTracksUpdated);
    DefineEvent(SavedPlaylistsUpdated);
    DefineEvent(PlaylistRenamed, std::string id;);

    Json(NavigationPushed, screen);
    Json(NavigationPopped);
    Json(NavigationPoppedTo, screen);
    Json(SearchUpdated, query);
    Json(SavedTracksUpdated);
    Json(SavedPlaylistsUpdated);
    Json(PlaylistRenamed, id);

    using Any = EventVariant<NavigationPushed, NavigationPopped, NavigationPoppedTo, SearchUpdated, SavedTracksUpdated, SavedPlaylistsUpdated, PlaylistRenamed>;
);

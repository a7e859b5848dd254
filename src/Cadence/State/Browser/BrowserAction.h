#pragma once

#include <vector>

#include "Core/Action/Action.h"
#include "Model/Playlist.h"
#include "Model/ScreenName.h"

DefineActionType(
    Browser,
    DefineAction(NavigationPush, ScreenName screen;);
    DefineAction(NavigationPop);
    DefineAction(NavigationPopTo, ScreenName screen;);
    DefineAction(Search, std::string query;);
    DefineAction(SaveTracks, std::vector<SongDescription> songs;);
    DefineAction(RemoveSavedTracks, std::vector<std::string> ids;);
    DefineAction(SetPlaylistsContent, std::vector<PlaylistDescription> playlists;);
    DefineAction(PrependPlaylistsContent, std::vector<PlaylistDescription> playlists;);
    DefineAction(UpdatePlaylistName, PlaylistSummary summary;);

    Json(NavigationPush, screen);
    Json(NavigationPop);
    Json(NavigationPopTo, screen);
    Json(Search, query);
    Json(SaveTracks, songs);
    Json(RemoveSavedTracks, ids);
    Json(SetPlaylistsContent, playlists);
    Json(PrependPlaylistsContent, playlists);
    Json(UpdatePlaylistName, summary);

    using Any = ActionVariant<NavigationPush, NavigationPop, NavigationPopTo, Search, SaveTracks, RemoveSavedTracks, SetPlaylistsContent, PrependPlaylistsContent, UpdatePlaylistName>;
);

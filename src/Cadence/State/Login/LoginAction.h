#pragma once

#include <vector>

#include "Core/Action/Action.h"
#include "Model/Playlist.h"

DefineActionType(
    Login,
    DefineAction(SetLoginSuccess, std::string username;);
    DefineAction(SetLoginFailure);
    DefineAction(Logout);
    DefineAction(SetUserPlaylists, std::vector<PlaylistSummary> playlists;);
    DefineAction(PrependUserPlaylist, std::vector<PlaylistSummary> playlists;);
    DefineAction(UpdateUserPlaylist, PlaylistSummary summary;);

    Json(SetLoginSuccess, username);
    Json(SetLoginFailure);
    Json(Logout);
    Json(SetUserPlaylists, playlists);
    Json(PrependUserPlaylist, playlists);
    Json(UpdateUserPlaylist, summary);

    using Any = ActionVariant<SetLoginSuccess, SetLoginFailure, Logout, SetUserPlaylists, PrependUserPlaylist, UpdateUserPlaylist>;
);

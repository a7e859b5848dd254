#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "Model/SelectionContext.h"
#include "State/Browser/BrowserAction.h"
#include "State/Login/LoginAction.h"
#include "State/Playback/PlaybackAction.h"
#include "State/Selection/SelectionAction.h"
#include "State/Settings/SettingsAction.h"

// Cross-cutting actions, applied by `AppState` rather than a single substate.
DefineActionType(
    App,
    DefineAction(Start);
    DefineAction(Raise);
    DefineAction(ShowNotification, std::string text;);
    DefineAction(ViewNowPlaying);
    DefineAction(EnableSelection, SelectionContext context;);
    DefineAction(CancelSelection);

    Json(Start);
    Json(Raise);
    Json(ShowNotification, text);
    Json(ViewNowPlaying);
    Json(EnableSelection, context);
    Json(CancelSelection);

    using Any = ActionVariant<Start, Raise, ShowNotification, ViewNowPlaying, EnableSelection, CancelSelection>;
);

// Selection x Playback: act on the play queue with the selected songs.
DefineActionType(
    SelectionQueue,
    DefineAction(QueueSelection);
    DefineAction(DequeueSelection);
    DefineAction(MoveUpSelection);
    DefineAction(MoveDownSelection);

    Json(QueueSelection);
    Json(DequeueSelection);
    Json(MoveUpSelection);
    Json(MoveDownSelection);

    using Any = ActionVariant<QueueSelection, DequeueSelection, MoveUpSelection, MoveDownSelection>;
);

// Selection x Browser: save/unsave the selected songs in the library.
DefineActionType(
    SelectionLibrary,
    DefineAction(SaveSelection);
    DefineAction(UnsaveSelection);

    Json(SaveSelection);
    Json(UnsaveSelection);

    using Any = ActionVariant<SaveSelection, UnsaveSelection>;
);

// Login x Browser: keep the session's playlists and the browser's library in agreement.
DefineActionType(
    UserPlaylist,
    DefineAction(CreatePlaylist, PlaylistDescription playlist;);
    DefineAction(UpdatePlaylistName, PlaylistSummary summary;);

    Json(CreatePlaylist, playlist);
    Json(UpdatePlaylistName, summary);

    using Any = ActionVariant<CreatePlaylist, UpdatePlaylistName>;
);

namespace Action {
using Any = MessageGroup<
    Playback::Any,
    Browser::Any,
    Selection::Any,
    Login::Any,
    Settings::Any,
    App::Any,
    SelectionQueue::Any,
    SelectionLibrary::Any,
    UserPlaylist::Any>;

Browser::NavigationPush ViewAlbum(std::string id);
Browser::NavigationPush ViewArtist(std::string id);
Browser::NavigationPush ViewPlaylist(std::string id);
Browser::NavigationPush ViewUser(std::string id);
Browser::NavigationPush ViewSearch();

// Parse a `spotify:{album|artist|playlist|user}:{id}` URI into the action that navigates to it.
// Returns nothing for anything else.
std::optional<Any> OpenUri(std::string_view uri);
} // namespace Action

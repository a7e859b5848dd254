#include "TestHelpers.h"

#include "App/AppState.h"
#include "Core/Error.h"

using Events = std::vector<Event::Any>;

static std::vector<std::string> QueuedIds(const AppState &state) {
    std::vector<std::string> ids;
    for (const auto &song : state.Playback.GetSongs()) ids.push_back(song.Id);
    return ids;
}

static void Select(AppState &state, const std::vector<SongDescription> &songs, SelectionContext context = {}) {
    state.Apply(Action::App::EnableSelection{std::move(context)});
    state.Apply(Action::Selection::Select{songs});
}

TEST_CASE("Starting happens once", "[AppState]") {
    AppState state;
    REQUIRE_FALSE(state.IsStarted());
    REQUIRE(state.Apply(Action::App::Start{}) == Events{Event::App::Started{}});
    REQUIRE(state.IsStarted());
    REQUIRE(state.Apply(Action::App::Start{}).empty());
}

TEST_CASE("Notifications only report themselves", "[AppState]") {
    AppState state;
    REQUIRE(state.Apply(Action::App::ShowNotification{"x"}) == Events{Event::App::NotificationShown{"x"}});
    REQUIRE(state.Apply(Action::App::ViewNowPlaying{}) == Events{Event::App::NowPlayingShown{}});
    REQUIRE(state.Apply(Action::App::Raise{}) == Events{Event::App::Raised{}});

    REQUIRE_FALSE(state.IsStarted());
    REQUIRE(state.Browser.GetDepth() == 1);
    REQUIRE(state.Playback.GetSongs().empty());
    REQUIRE_FALSE(state.Selection.IsActive());
}

TEST_CASE("Substate actions are forwarded to their substate", "[AppState]") {
    AppState state;
    REQUIRE(state.Apply(Action::Playback::Queue{{MakeSong("a")}}) == Events{Event::Playback::PlaylistChanged{}});
    REQUIRE(state.Apply(Action::ViewAlbum("al1")) == Events{Event::Browser::NavigationPushed{ScreenName::AlbumDetails("al1")}});
    REQUIRE(state.Apply(Action::Login::SetLoginSuccess{"bob"}) == Events{Event::Login::LoginCompleted{"bob"}});
    REQUIRE(state.Apply(Action::Settings::ChangeSettings{{Theme::Dark}}) == Events{Event::Settings::ThemeChanged{Theme::Dark}});
    REQUIRE(state.Apply(Action::Selection::Clear{}).empty());
}

TEST_CASE("Selection mode", "[AppState]") {
    AppState state;
    const SelectionContext context{SelectionContext::Type::Queue};

    REQUIRE(state.Apply(Action::App::CancelSelection{}).empty());
    REQUIRE(state.Apply(Action::App::EnableSelection{context}) == Events{Event::Selection::SelectionModeChanged{true}});

    SECTION("Enabling the active context does nothing") {
        REQUIRE(state.Apply(Action::App::EnableSelection{context}).empty());
    }
    SECTION("Enabling another context switches to it") {
        REQUIRE(state.Apply(Action::App::EnableSelection{{SelectionContext::Type::SavedTracks}}) == Events{Event::Selection::SelectionModeChanged{true}});
        REQUIRE(state.Selection.GetContext()->Kind == SelectionContext::Type::SavedTracks);
    }
    SECTION("Cancelling") {
        REQUIRE(state.Apply(Action::App::CancelSelection{}) == Events{Event::Selection::SelectionModeChanged{false}});
        REQUIRE_FALSE(state.Selection.IsActive());
    }
}

TEST_CASE("Queueing the selection", "[AppState]") {
    AppState state;
    Select(state, {MakeSong("a"), MakeSong("b")});

    SECTION("Queue") {
        REQUIRE(state.Apply(Action::SelectionQueue::QueueSelection{}) == Events{Event::Selection::SelectionModeChanged{false}, Event::Playback::PlaylistChanged{}});
        REQUIRE(state.Selection.PeekSelection().empty());
        REQUIRE_FALSE(state.Selection.IsActive());
        REQUIRE(QueuedIds(state) == std::vector<std::string>{"a", "b"});
    }
    SECTION("Dequeue") {
        state.Apply(Action::Playback::Queue{{MakeSong("a"), MakeSong("c"), MakeSong("b")}});
        REQUIRE(state.Apply(Action::SelectionQueue::DequeueSelection{}) == Events{Event::Selection::SelectionModeChanged{false}, Event::Playback::PlaylistChanged{}});
        REQUIRE(state.Selection.PeekSelection().empty());
        REQUIRE(QueuedIds(state) == std::vector<std::string>{"c"});
    }
}

TEST_CASE("Moving the selection in the queue", "[AppState]") {
    AppState state;
    state.Apply(Action::Playback::Queue{{MakeSong("a"), MakeSong("b"), MakeSong("c")}});

    SECTION("An empty selection moves nothing") {
        REQUIRE(state.Apply(Action::SelectionQueue::MoveUpSelection{}).empty());
        REQUIRE(state.Apply(Action::SelectionQueue::MoveDownSelection{}).empty());
    }
    SECTION("Only the first selected song moves, and the selection is kept") {
        Select(state, {MakeSong("b"), MakeSong("c")}, {SelectionContext::Type::Queue});
        REQUIRE(state.Apply(Action::SelectionQueue::MoveUpSelection{}) == Events{Event::Playback::PlaylistChanged{}});
        REQUIRE(QueuedIds(state) == std::vector<std::string>{"b", "a", "c"});
        REQUIRE(state.Selection.PeekSelection().size() == 2);

        REQUIRE(state.Apply(Action::SelectionQueue::MoveUpSelection{}).empty());
        REQUIRE(state.Apply(Action::SelectionQueue::MoveDownSelection{}) == Events{Event::Playback::PlaylistChanged{}});
        REQUIRE(QueuedIds(state) == std::vector<std::string>{"a", "b", "c"});
    }
    SECTION("A selected song that isn't queued moves nothing") {
        Select(state, {MakeSong("z")});
        REQUIRE(state.Apply(Action::SelectionQueue::MoveDownSelection{}).empty());
    }
}

TEST_CASE("Saving the selection", "[AppState]") {
    AppState state;
    Select(state, {MakeSong("a"), MakeSong("b")}, {SelectionContext::Type::Playlist});

    SECTION("Save") {
        REQUIRE(state.Apply(Action::SelectionLibrary::SaveSelection{}) == Events{Event::Browser::SavedTracksUpdated{}, Event::Selection::SelectionModeChanged{false}});
        REQUIRE(state.Browser.GetHome()->GetSavedTracks() == std::vector<SongDescription>{MakeSong("a"), MakeSong("b")});
        REQUIRE(state.Selection.PeekSelection().empty());
    }
    SECTION("Unsave") {
        state.Apply(Action::Browser::SaveTracks{{MakeSong("a"), MakeSong("c")}});
        REQUIRE(state.Apply(Action::SelectionLibrary::UnsaveSelection{}) == Events{Event::Browser::SavedTracksUpdated{}, Event::Selection::SelectionModeChanged{false}});
        REQUIRE(state.Browser.GetHome()->GetSavedTracks() == std::vector<SongDescription>{MakeSong("c")});
    }
    SECTION("Without a Home screen, nothing changes") {
        state.Browser = BrowserState{ScreenName::Search()};
        REQUIRE_THROWS_AS(state.Apply(Action::SelectionLibrary::SaveSelection{}), PreconditionError);
        REQUIRE_THROWS_AS(state.Apply(Action::SelectionLibrary::UnsaveSelection{}), PreconditionError);
        REQUIRE(state.Selection.PeekSelection().size() == 2);
        REQUIRE(state.Selection.IsActive());
    }
}

TEST_CASE("User playlists", "[AppState]") {
    AppState state;
    state.Apply(Action::Login::SetLoginSuccess{"bob"});

    SECTION("Creating a playlist") {
        const auto events = state.Apply(Action::UserPlaylist::CreatePlaylist{MakePlaylist("pl1", "Mix")});
        REQUIRE(events == Events{Event::Login::UserPlaylistsLoaded{}, Event::Browser::SavedPlaylistsUpdated{}, Event::App::PlaylistCreatedNotificationShown{"pl1"}});
        REQUIRE(state.LoggedUser.GetPlaylists() == std::vector<PlaylistSummary>{{"pl1", "Mix"}});
        REQUIRE(state.Browser.GetHome()->GetPlaylists() == std::vector<PlaylistDescription>{MakePlaylist("pl1", "Mix")});
    }
    SECTION("Renaming a playlist") {
        state.Apply(Action::UserPlaylist::CreatePlaylist{MakePlaylist("pl1", "Mix")});
        const auto events = state.Apply(Action::UserPlaylist::UpdatePlaylistName{{"pl1", "Jams"}});
        REQUIRE(events == Events{Event::Login::UserPlaylistsLoaded{}, Event::Browser::PlaylistRenamed{"pl1"}});
        REQUIRE(state.LoggedUser.GetPlaylists().front().Title == "Jams");
        REQUIRE(state.Browser.GetHome()->GetPlaylists().front().Title == "Jams");
    }
    SECTION("Renaming an unknown playlist does nothing") {
        REQUIRE(state.Apply(Action::UserPlaylist::UpdatePlaylistName{{"pl9", "Nope"}}).empty());
    }
}

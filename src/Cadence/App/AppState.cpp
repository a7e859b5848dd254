#include "AppState.h"

#include "Core/Error.h"
#include "Helper/Variant.h"

using std::vector;

static void Append(vector<Event::Any> &events, vector<Event::Any> &&more) {
    events.insert(events.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

vector<Event::Any> AppState::Apply(const Action::Any &action) {
    return std::visit(
        Match{
            [this](const Action::Playback::Any &a) { return Forward(a, Playback); },
            [this](const Action::Browser::Any &a) { return Forward(a, Browser); },
            [this](const Action::Selection::Any &a) { return Forward(a, Selection); },
            [this](const Action::Login::Any &a) { return Forward(a, LoggedUser); },
            [this](const Action::Settings::Any &a) { return Forward(a, Settings); },
            // Cross-cutting
            [this](const Action::App::Any &a) { return ApplyApp(a); },
            [this](const Action::SelectionQueue::Any &a) { return ApplySelectionQueue(a); },
            [this](const Action::SelectionLibrary::Any &a) { return ApplySelectionLibrary(a); },
            [this](const Action::UserPlaylist::Any &a) { return ApplyUserPlaylist(a); },
        },
        action
    );
}

vector<Event::Any> AppState::ApplyApp(const Action::App::Any &action) {
    return std::visit(
        Match{
            [this](const Action::App::Start &) -> vector<Event::Any> {
                if (Started) return {};
                Started = true;
                return {Event::App::Started{}};
            },
            [](const Action::App::Raise &) -> vector<Event::Any> { return {Event::App::Raised{}}; },
            [](const Action::App::ShowNotification &a) -> vector<Event::Any> { return {Event::App::NotificationShown{a.text}}; },
            [](const Action::App::ViewNowPlaying &) -> vector<Event::Any> { return {Event::App::NowPlayingShown{}}; },
            [this](const Action::App::EnableSelection &a) -> vector<Event::Any> {
                if (const auto active = Selection.SetMode(a.context)) return {Event::Selection::SelectionModeChanged{*active}};
                return {};
            },
            [this](const Action::App::CancelSelection &) -> vector<Event::Any> {
                if (const auto active = Selection.SetMode(std::nullopt)) return {Event::Selection::SelectionModeChanged{*active}};
                return {};
            },
        },
        action
    );
}

vector<Event::Any> AppState::ApplySelectionQueue(const Action::SelectionQueue::Any &action) {
    return std::visit(
        Match{
            [this](const Action::SelectionQueue::QueueSelection &) -> vector<Event::Any> {
                Playback.Queue(Selection.TakeSelection());
                return {Event::Selection::SelectionModeChanged{false}, Event::Playback::PlaylistChanged{}};
            },
            [this](const Action::SelectionQueue::DequeueSelection &) -> vector<Event::Any> {
                const auto songs = Selection.TakeSelection();
                Playback.Dequeue(songs | ranges::views::transform([](const auto &song) { return song.Id; }) | ranges::to<vector>());
                return {Event::Selection::SelectionModeChanged{false}, Event::Playback::PlaylistChanged{}};
            },
            // Only the first selected song is moved.
            [this](const Action::SelectionQueue::MoveUpSelection &) -> vector<Event::Any> {
                const auto selection = Selection.PeekSelection();
                if (selection.empty() || !Playback.MoveUp(selection.front().Id)) return {};
                return {Event::Playback::PlaylistChanged{}};
            },
            [this](const Action::SelectionQueue::MoveDownSelection &) -> vector<Event::Any> {
                const auto selection = Selection.PeekSelection();
                if (selection.empty() || !Playback.MoveDown(selection.front().Id)) return {};
                return {Event::Playback::PlaylistChanged{}};
            },
        },
        action
    );
}

vector<Event::Any> AppState::ApplySelectionLibrary(const Action::SelectionLibrary::Any &action) {
    auto &home = RequireHome();
    auto events = std::visit(
        Match{
            [this, &home](const Action::SelectionLibrary::SaveSelection &) {
                return Forward(Action::Browser::SaveTracks{Selection.TakeSelection()}, home);
            },
            [this, &home](const Action::SelectionLibrary::UnsaveSelection &) {
                const auto songs = Selection.TakeSelection();
                return Forward(Action::Browser::RemoveSavedTracks{songs | ranges::views::transform([](const auto &song) { return song.Id; }) | ranges::to<vector>()}, home);
            },
        },
        action
    );
    events.emplace_back(Event::Selection::SelectionModeChanged{false});
    return events;
}

vector<Event::Any> AppState::ApplyUserPlaylist(const Action::UserPlaylist::Any &action) {
    return std::visit(
        Match{
            [this](const Action::UserPlaylist::CreatePlaylist &a) {
                auto events = Forward(Action::Login::PrependUserPlaylist{{a.playlist.Summary()}}, LoggedUser);
                Append(events, Forward(Action::Browser::PrependPlaylistsContent{{a.playlist}}, Browser));
                events.emplace_back(Event::App::PlaylistCreatedNotificationShown{a.playlist.Id});
                return events;
            },
            [this](const Action::UserPlaylist::UpdatePlaylistName &a) {
                auto events = Forward(Action::Login::UpdateUserPlaylist{a.summary}, LoggedUser);
                Append(events, Forward(Action::Browser::UpdatePlaylistName{a.summary}, Browser));
                return events;
            },
        },
        action
    );
}

HomeState &AppState::RequireHome() {
    auto *home = Browser.GetHome();
    if (!home) throw PreconditionError{"The browser has no Home screen to save the selection to."};
    return *home;
}

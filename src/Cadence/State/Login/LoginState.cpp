#include "LoginState.h"

#include <algorithm>

#include "Helper/Variant.h"

using std::vector;

namespace Events = Event::Login;

vector<LoginState::EventType> LoginState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Login::SetLoginSuccess &a) -> vector<EventType> {
                Username = a.username;
                return {Events::LoginCompleted{a.username}};
            },
            [this](const Action::Login::SetLoginFailure &) -> vector<EventType> {
                Username.reset();
                return {Events::LoginFailed{}};
            },
            [this](const Action::Login::Logout &) -> vector<EventType> {
                if (!Username) return {};
                Username.reset();
                Playlists.clear();
                return {Events::LogoutCompleted{}};
            },
            [this](const Action::Login::SetUserPlaylists &a) -> vector<EventType> {
                Playlists = a.playlists;
                return {Events::UserPlaylistsLoaded{}};
            },
            [this](const Action::Login::PrependUserPlaylist &a) -> vector<EventType> {
                Playlists.insert(Playlists.begin(), a.playlists.begin(), a.playlists.end());
                return {Events::UserPlaylistsLoaded{}};
            },
            [this](const Action::Login::UpdateUserPlaylist &a) -> vector<EventType> {
                const auto it = std::ranges::find(Playlists, a.summary.Id, &PlaylistSummary::Id);
                if (it == Playlists.end()) return {};
                it->Title = a.summary.Title;
                return {Events::UserPlaylistsLoaded{}};
            },
        },
        action
    );
}

#include "ScreenState.h"

#include <algorithm>

#include "Helper/Variant.h"

using std::vector;

namespace Events = Event::Browser;

vector<ScreenState::EventType> HomeState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Browser::SaveTracks &a) -> vector<EventType> {
                vector<SongDescription> unsaved;
                for (const auto &song : a.songs) {
                    const bool saved = std::ranges::find(SavedTracks, song.Id, &SongDescription::Id) != SavedTracks.end() ||
                        std::ranges::find(unsaved, song.Id, &SongDescription::Id) != unsaved.end();
                    if (!saved) unsaved.push_back(song);
                }
                SavedTracks.insert(SavedTracks.begin(), unsaved.begin(), unsaved.end());
                return {Events::SavedTracksUpdated{}};
            },
            [this](const Action::Browser::RemoveSavedTracks &a) -> vector<EventType> {
                std::erase_if(SavedTracks, [&a](const auto &song) { return std::ranges::find(a.ids, song.Id) != a.ids.end(); });
                return {Events::SavedTracksUpdated{}};
            },
            [this](const Action::Browser::SetPlaylistsContent &a) -> vector<EventType> {
                Playlists = a.playlists;
                return {Events::SavedPlaylistsUpdated{}};
            },
            [this](const Action::Browser::PrependPlaylistsContent &a) -> vector<EventType> {
                Playlists.insert(Playlists.begin(), a.playlists.begin(), a.playlists.end());
                return {Events::SavedPlaylistsUpdated{}};
            },
            [this](const Action::Browser::UpdatePlaylistName &a) -> vector<EventType> {
                const auto it = std::ranges::find(Playlists, a.summary.Id, &PlaylistDescription::Id);
                if (it == Playlists.end()) return {};
                it->Title = a.summary.Title;
                return {Events::PlaylistRenamed{a.summary.Id}};
            },
            [](const auto &) -> vector<EventType> { return {}; },
        },
        action
    );
}

vector<ScreenState::EventType> PlaylistDetailsState::Apply(const ActionType &action) {
    const auto learn_title = [this](const vector<PlaylistDescription> &playlists) {
        const auto it = std::ranges::find(playlists, Name.Id, &PlaylistDescription::Id);
        if (it != playlists.end()) Title = it->Title;
    };
    return std::visit(
        Match{
            [&learn_title](const Action::Browser::SetPlaylistsContent &a) -> vector<EventType> {
                learn_title(a.playlists);
                return {};
            },
            [&learn_title](const Action::Browser::PrependPlaylistsContent &a) -> vector<EventType> {
                learn_title(a.playlists);
                return {};
            },
            [this](const Action::Browser::UpdatePlaylistName &a) -> vector<EventType> {
                if (a.summary.Id != Name.Id) return {};
                Title = a.summary.Title;
                return {Events::PlaylistRenamed{a.summary.Id}};
            },
            [](const auto &) -> vector<EventType> { return {}; },
        },
        action
    );
}

std::unique_ptr<ScreenState> CreateScreenState(const ScreenName &name) {
    switch (name.Kind) {
        case ScreenName::Type::Home: return std::make_unique<HomeState>();
        case ScreenName::Type::Search: return std::make_unique<SearchState>();
        case ScreenName::Type::PlaylistDetails: return std::make_unique<PlaylistDetailsState>(name);
        case ScreenName::Type::AlbumDetails:
        case ScreenName::Type::Artist:
        case ScreenName::Type::User: return std::make_unique<ScreenState>(name);
    }
    return std::make_unique<ScreenState>(name);
}

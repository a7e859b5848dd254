#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "BrowserAction.h"
#include "BrowserEvent.h"
#include "Core/Action/Actionable.h"

// A sub-view in the browser's navigation stack.
// Content actions are offered to every screen, and each screen reacts to the ones it holds content for.
struct ScreenState : Actionable<Action::Browser::Any, Event::Browser::Any> {
    ScreenState(ScreenName name) : Name(std::move(name)) {}

    std::vector<EventType> Apply(const ActionType &) override { return {}; }

    const ScreenName Name;
};

// The library: saved tracks and the user's playlists, most recent first.
struct HomeState : ScreenState {
    HomeState() : ScreenState(ScreenName::Home()) {}

    std::vector<EventType> Apply(const ActionType &) override;

    const std::vector<SongDescription> &GetSavedTracks() const { return SavedTracks; }
    const std::vector<PlaylistDescription> &GetPlaylists() const { return Playlists; }

private:
    std::vector<SongDescription> SavedTracks{};
    std::vector<PlaylistDescription> Playlists{};
};

struct PlaylistDetailsState : ScreenState {
    using ScreenState::ScreenState;

    std::vector<EventType> Apply(const ActionType &) override;

    // Known once a playlist listing or rename mentions this playlist.
    const std::optional<std::string> &GetTitle() const { return Title; }

private:
    std::optional<std::string> Title{};
};

struct SearchState : ScreenState {
    SearchState() : ScreenState(ScreenName::Search()) {}

    std::string Query{};
};

std::unique_ptr<ScreenState> CreateScreenState(const ScreenName &);

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Core/Action/Actionable.h"
#include "LoginAction.h"
#include "LoginEvent.h"

// The logged-in user's session, and the user's playlists (most recent first).
struct LoginState : Actionable<Action::Login::Any, Event::Login::Any> {
    std::vector<EventType> Apply(const ActionType &) override;

    bool IsLoggedIn() const { return Username.has_value(); }
    const std::optional<std::string> &GetUsername() const { return Username; }
    const std::vector<PlaylistSummary> &GetPlaylists() const { return Playlists; }

private:
    std::optional<std::string> Username{};
    std::vector<PlaylistSummary> Playlists{};
};

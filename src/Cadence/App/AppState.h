#pragma once

#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "AppAction.h"
#include "AppEvent.h"
#include "State/Browser/BrowserState.h"
#include "State/Login/LoginState.h"
#include "State/Playback/PlaybackState.h"
#include "State/Selection/SelectionState.h"
#include "State/Settings/SettingsState.h"

// Apply a substate's own action to it, and lift the events it reports into `Event::Any`.
template<typename Target>
std::vector<Event::Any> Forward(const typename Target::ActionType &action, Target &target) {
    const auto events = target.Apply(action);
    return events | ranges::views::transform([](const auto &event) { return Event::Any{event}; }) | ranges::to<std::vector>();
}

/**
The root of all application state, and the only place cross-cutting actions are applied.

Substate-scoped actions are forwarded as-is to the substate that owns them.
Cross-cutting actions coordinate two substates, and their events are returned in a fixed order:
events reported by a substate come first, followed by any events added here.

`Apply` is synchronous and not thread-safe. Callers serialize access (see `Dispatcher`).
*/
struct AppState {
    // Throws `PreconditionError` (leaving all state untouched) when saving/unsaving the selection without a Home screen.
    std::vector<Event::Any> Apply(const Action::Any &);

    bool IsStarted() const { return Started; }

    PlaybackState Playback{};
    BrowserState Browser{};
    SelectionState Selection{};
    LoginState LoggedUser{};
    SettingsState Settings{};

private:
    std::vector<Event::Any> ApplyApp(const Action::App::Any &);
    std::vector<Event::Any> ApplySelectionQueue(const Action::SelectionQueue::Any &);
    std::vector<Event::Any> ApplySelectionLibrary(const Action::SelectionLibrary::Any &);
    std::vector<Event::Any> ApplyUserPlaylist(const Action::UserPlaylist::Any &);

    HomeState &RequireHome();

    bool Started{false};
};

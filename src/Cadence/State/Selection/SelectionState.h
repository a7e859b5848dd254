#pragma once

#include <optional>
#include <span>
#include <vector>

#include "Core/Action/Actionable.h"
#include "Model/SelectionContext.h"
#include "SelectionAction.h"
#include "SelectionEvent.h"

/**
Multi-item selection. Songs can only be selected while the mode is active (i.e. a context is set).
The buffer keeps selection order, and holds each song id at most once.
*/
struct SelectionState : Actionable<Action::Selection::Any, Event::Selection::Any> {
    std::vector<EventType> Apply(const ActionType &) override;

    // Drain the buffer and leave selection mode.
    std::vector<SongDescription> TakeSelection();
    std::span<const SongDescription> PeekSelection() const { return Songs; }

    // Enter, switch or leave selection mode.
    // Returns the new active flag if this was a transition, and nothing if the mode didn't change.
    // Leaving or switching contexts clears the buffer.
    std::optional<bool> SetMode(std::optional<SelectionContext>);

    bool IsActive() const { return Context.has_value(); }
    const std::optional<SelectionContext> &GetContext() const { return Context; }
    bool IsSelected(const std::string &id) const;

private:
    std::optional<SelectionContext> Context{};
    std::vector<SongDescription> Songs{};
};

#pragma once

#include <vector>

#include "Core/Action/Actionable.h"
#include "SettingsAction.h"
#include "SettingsEvent.h"

struct SettingsState : Actionable<Action::Settings::Any, Event::Settings::Any> {
    std::vector<EventType> Apply(const ActionType &) override;

    const ::Settings &Get() const { return Current; }

private:
    ::Settings Current{};
};

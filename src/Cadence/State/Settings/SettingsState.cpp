#include "SettingsState.h"

#include "Helper/Variant.h"

using std::vector;

namespace Events = Event::Settings;

vector<SettingsState::EventType> SettingsState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Settings::ChangeSettings &a) -> vector<EventType> {
                vector<EventType> events;
                if (a.settings.Theme != Current.Theme) events.emplace_back(Events::ThemeChanged{a.settings.Theme});
                if (a.settings.Player != Current.Player) events.emplace_back(Events::PlayerSettingsChanged{});
                Current = a.settings;
                return events;
            },
        },
        action
    );
}

#pragma once

#include "Core/Event/Event.h"
#include "Settings.h"

DefineEventType(
    Settings,
    DefineEvent(ThemeChanged, ::Theme theme;);
    DefineEvent(PlayerSettingsChanged);

    Json(ThemeChanged, theme);
    Json(PlayerSettingsChanged);

    using Any = EventVariant<ThemeChanged, PlayerSettingsChanged>;
);

#pragma once

#include "Core/Action/Action.h"
#include "Settings.h"

DefineActionType(
    Settings,
    DefineAction(ChangeSettings, ::Settings settings;);

    Json(ChangeSettings, settings);

    using Any = ActionVariant<ChangeSettings>;
);

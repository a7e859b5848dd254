#pragma once

#include <string>
#include <vector>

#include "Core/Event/Event.h"

DefineEventType(
    Selection,
    DefineEvent(Selected, std::vector<std::string> ids;);
    DefineEvent(Deselected, std::vector<std::string> ids;);
    DefineEvent(SelectionModeChanged, bool active;);

    Json(Selected, ids);
    Json(Deselected, ids);
    Json(SelectionModeChanged, active);

    using Any = EventVariant<Selected, Deselected, SelectionModeChanged>;
);

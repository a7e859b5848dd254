#pragma once

#include <vector>

#include "Core/Action/Action.h"
#include "Model/Song.h"

DefineActionType(
    Selection,
    DefineAction(Select, std::vector<SongDescription> songs;);
    DefineAction(Deselect, std::vector<std::string> ids;);
    DefineAction(Clear);

    Json(Select, songs);
    Json(Deselect, ids);
    Json(Clear);

    using Any = ActionVariant<Select, Deselect, Clear>;
);

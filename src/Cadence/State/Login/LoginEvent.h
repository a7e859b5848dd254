#pragma once

#include <string>

#include "Core/Event/Event.h"

DefineEventType(
    Login,
    DefineEvent(LoginCompleted, std::string username;);
    DefineEvent(LoginFailed);
    DefineEvent(LogoutCompleted);
    DefineEvent(UserPlaylistsLoaded);

    Json(LoginCompleted, username);
    Json(LoginFailed);
    Json(LogoutCompleted);
    Json(UserPlaylistsLoaded);

    using Any = EventVariant<LoginCompleted, LoginFailed, LogoutCompleted, UserPlaylistsLoaded>;
);

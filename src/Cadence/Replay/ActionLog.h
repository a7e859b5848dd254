#pragma once

#include <string_view>
#include <vector>

#include "App/AppAction.h"

/**
An action log has one serialized action per line, e.g. `["Playback/PlaySong", {"id": "s1"}]`.
Blank lines, and lines starting with `#`, are skipped.

Throws `std::runtime_error` naming the (1-based) line of the first action that can't be read.
*/
std::vector<Action::Any> ParseActionLog(std::string_view contents);

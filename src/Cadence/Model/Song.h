#pragma once

#include <string>

#include "Core/Json.h"
#include "Core/Scalar.h"

struct SongDescription {
    std::string Id;
    std::string Title;
    std::string Artist;
    std::string AlbumId;
    std::string AlbumTitle;
    u32 DurationMs{0};

    bool operator==(const SongDescription &) const = default;
};

Json(SongDescription, Id, Title, Artist, AlbumId, AlbumTitle, DurationMs);

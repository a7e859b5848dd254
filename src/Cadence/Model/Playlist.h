#pragma once

#include <string>
#include <vector>

#include "Model/Song.h"

// The part of a playlist shown in listings.
struct PlaylistSummary {
    std::string Id;
    std::string Title;

    bool operator==(const PlaylistSummary &) const = default;
};

struct PlaylistDescription {
    std::string Id;
    std::string Title;
    std::string OwnerId;
    std::vector<SongDescription> Songs{};

    PlaylistSummary Summary() const { return {Id, Title}; }

    bool operator==(const PlaylistDescription &) const = default;
};

Json(PlaylistSummary, Id, Title);
Json(PlaylistDescription, Id, Title, OwnerId, Songs);

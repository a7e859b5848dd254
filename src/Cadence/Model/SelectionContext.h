#pragma once

#include <string>

#include "Core/Json.h"

// What kind of items are being multi-selected.
// `PlaylistId` is only set for `EditablePlaylist`.
struct SelectionContext {
    enum class Type {
        Default,
        Queue,
        ReadOnlyQueue,
        SavedTracks,
        Playlist,
        EditablePlaylist,
    };

    Type Kind{Type::Default};
    std::string PlaylistId{};

    static SelectionContext EditablePlaylist(std::string playlist_id) { return {Type::EditablePlaylist, std::move(playlist_id)}; }

    bool operator==(const SelectionContext &) const = default;
};

JsonEnum(
    SelectionContext::Type,
    {
        {SelectionContext::Type::Default, "Default"},
        {SelectionContext::Type::Queue, "Queue"},
        {SelectionContext::Type::ReadOnlyQueue, "ReadOnlyQueue"},
        {SelectionContext::Type::SavedTracks, "SavedTracks"},
        {SelectionContext::Type::Playlist, "Playlist"},
        {SelectionContext::Type::EditablePlaylist, "EditablePlaylist"},
    }
)

Json(SelectionContext, Kind, PlaylistId);

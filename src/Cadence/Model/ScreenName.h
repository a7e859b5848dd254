#pragma once

#include <string>

#include "Core/Json.h"

// Identifies a screen in the browser's navigation stack.
// `Id` is the entity shown by the screen, and empty for `Home` and `Search`.
struct ScreenName {
    enum class Type {
        Home,
        AlbumDetails,
        Artist,
        PlaylistDetails,
        User,
        Search,
    };

    Type Kind{Type::Home};
    std::string Id{};

    static ScreenName Home() { return {Type::Home}; }
    static ScreenName AlbumDetails(std::string id) { return {Type::AlbumDetails, std::move(id)}; }
    static ScreenName Artist(std::string id) { return {Type::Artist, std::move(id)}; }
    static ScreenName PlaylistDetails(std::string id) { return {Type::PlaylistDetails, std::move(id)}; }
    static ScreenName User(std::string id) { return {Type::User, std::move(id)}; }
    static ScreenName Search() { return {Type::Search}; }

    bool operator==(const ScreenName &) const = default;
};

JsonEnum(
    ScreenName::Type,
    {
        {ScreenName::Type::Home, "Home"},
        {ScreenName::Type::AlbumDetails, "AlbumDetails"},
        {ScreenName::Type::Artist, "Artist"},
        {ScreenName::Type::PlaylistDetails, "PlaylistDetails"},
        {ScreenName::Type::User, "User"},
        {ScreenName::Type::Search, "Search"},
    }
)

Json(ScreenName, Kind, Id);

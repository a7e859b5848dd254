#include "AppAction.h"

#include <algorithm>
#include <format>

#include "Helper/String.h"

#include "Core/Log.h"

namespace Action {
Browser::NavigationPush ViewAlbum(std::string id) { return {ScreenName::AlbumDetails(std::move(id))}; }
Browser::NavigationPush ViewArtist(std::string id) { return {ScreenName::Artist(std::move(id))}; }
Browser::NavigationPush ViewPlaylist(std::string id) { return {ScreenName::PlaylistDetails(std::move(id))}; }
Browser::NavigationPush ViewUser(std::string id) { return {ScreenName::User(std::move(id))}; }
Browser::NavigationPush ViewSearch() { return {ScreenName::Search()}; }

std::optional<Any> OpenUri(std::string_view uri) {
    LogIf(LogLevel::Debug, [uri] { return std::format("Parsing URI: {}", uri); });

    const auto segments = StringHelper::Split(uri, ':');
    if (segments.size() != 3 || segments[0] != "spotify") return {};

    // Some URI parsers turn `spotify:album:...` into `spotify:///album:...`.
    auto kind = segments[1];
    kind.remove_prefix(std::min(kind.find_first_not_of('/'), kind.size()));

    const auto id = std::string{segments[2]};
    if (id.empty()) return {};

    if (kind == "album") return ViewAlbum(id);
    if (kind == "artist") return ViewArtist(id);
    if (kind == "playlist") return ViewPlaylist(id);
    if (kind == "user") return ViewUser(id);
    return {};
}
} // namespace Action

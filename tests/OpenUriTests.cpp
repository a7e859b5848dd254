#include "TestHelpers.h"

using Action::OpenUri;

TEST_CASE("Entity URIs open the matching screen", "[OpenUri]") {
    REQUIRE(OpenUri("spotify:album:123") == Action::Any{Action::ViewAlbum("123")});
    REQUIRE(OpenUri("spotify:artist:abc") == Action::Any{Action::ViewArtist("abc")});
    REQUIRE(OpenUri("spotify:playlist:p1") == Action::Any{Action::ViewPlaylist("p1")});
    REQUIRE(OpenUri("spotify:user:bob") == Action::Any{Action::ViewUser("bob")});
}

TEST_CASE("Leading slashes before the entity kind are ignored", "[OpenUri]") {
    const auto expected = OpenUri("spotify:album:123");
    REQUIRE(expected.has_value());
    REQUIRE(OpenUri("spotify:///album:123") == expected);
    REQUIRE(OpenUri("spotify:/album:123") == expected);
}

TEST_CASE("URIs with more than three segments open nothing", "[OpenUri]") {
    REQUIRE_FALSE(OpenUri("spotify:user:bob:playlist:p1"));
    REQUIRE_FALSE(OpenUri("spotify:album:123:"));
}

TEST_CASE("Malformed URIs open nothing", "[OpenUri]") {
    SECTION("Unsupported entity kind") {
        REQUIRE_FALSE(OpenUri("spotify:track:123"));
        REQUIRE_FALSE(OpenUri("spotify:Album:123"));
    }
    SECTION("Other schemes") {
        REQUIRE_FALSE(OpenUri("http://example.com"));
        REQUIRE_FALSE(OpenUri("Spotify:album:123"));
    }
    SECTION("Missing segments") {
        REQUIRE_FALSE(OpenUri(""));
        REQUIRE_FALSE(OpenUri("spotify"));
        REQUIRE_FALSE(OpenUri("spotify:album"));
        REQUIRE_FALSE(OpenUri("spotify::123"));
        REQUIRE_FALSE(OpenUri("spotify:///:123"));
        REQUIRE_FALSE(OpenUri("spotify:album:"));
    }
}

TEST_CASE("Navigation helpers push the entity's screen", "[OpenUri]") {
    REQUIRE(Action::ViewAlbum("a").screen == ScreenName::AlbumDetails("a"));
    REQUIRE(Action::ViewPlaylist("p").screen == ScreenName::PlaylistDetails("p"));
    REQUIRE(Action::ViewSearch().screen == ScreenName::Search());
}

#include "TestHelpers.h"

#include <type_traits>

#include "State/Browser/BrowserState.h"

using namespace Action::Browser;
using Events = std::vector<Event::Browser::Any>;

TEST_CASE("Browser navigation", "[Browser]") {
    BrowserState browser;
    REQUIRE(browser.GetNavigation() == std::vector<ScreenName>{ScreenName::Home()});

    SECTION("The root screen is never popped") {
        REQUIRE(browser.Apply(NavigationPop{}).empty());
        REQUIRE(browser.GetDepth() == 1);
    }

    REQUIRE(browser.Apply(Action::ViewArtist("a1")) == Events{Event::Browser::NavigationPushed{ScreenName::Artist("a1")}});
    REQUIRE(browser.Apply(Action::ViewAlbum("al1")) == Events{Event::Browser::NavigationPushed{ScreenName::AlbumDetails("al1")}});

    SECTION("Pushing the screen on top does nothing") {
        REQUIRE(browser.Apply(Action::ViewAlbum("al1")).empty());
        REQUIRE(browser.GetDepth() == 3);
    }
    SECTION("Popping") {
        REQUIRE(browser.Apply(NavigationPop{}) == Events{Event::Browser::NavigationPopped{}});
        REQUIRE(browser.GetCurrent().Name == ScreenName::Artist("a1"));
    }
    SECTION("Popping to a screen in the stack") {
        REQUIRE(browser.Apply(NavigationPopTo{ScreenName::Home()}) == Events{Event::Browser::NavigationPoppedTo{ScreenName::Home()}});
        REQUIRE(browser.GetNavigation() == std::vector<ScreenName>{ScreenName::Home()});
    }
    SECTION("Popping to a screen not in the stack, or already on top, does nothing") {
        REQUIRE(browser.Apply(NavigationPopTo{ScreenName::User("u1")}).empty());
        REQUIRE(browser.Apply(NavigationPopTo{ScreenName::AlbumDetails("al1")}).empty());
        REQUIRE(browser.GetDepth() == 3);
    }
}

TEST_CASE("Browser search", "[Browser]") {
    BrowserState browser;
    REQUIRE(browser.Apply(Search{"jazz"}) == Events{Event::Browser::NavigationPushed{ScreenName::Search()}, Event::Browser::SearchUpdated{"jazz"}});
    REQUIRE(browser.Apply(Search{"blues"}) == Events{Event::Browser::SearchUpdated{"blues"}});
    REQUIRE(browser.GetDepth() == 2);
    REQUIRE(static_cast<const SearchState &>(browser.GetCurrent()).Query == "blues");
}

TEST_CASE("Browser library content", "[Browser]") {
    BrowserState browser;
    auto *home = browser.GetHome();
    REQUIRE(home != nullptr);

    SECTION("Saved tracks are prepended, once each") {
        REQUIRE(browser.Apply(SaveTracks{{MakeSong("a")}}) == Events{Event::Browser::SavedTracksUpdated{}});
        browser.Apply(SaveTracks{{MakeSong("b"), MakeSong("a"), MakeSong("c")}});
        REQUIRE(home->GetSavedTracks() == std::vector<SongDescription>{MakeSong("b"), MakeSong("c"), MakeSong("a")});

        REQUIRE(browser.Apply(RemoveSavedTracks{{"c", "missing"}}) == Events{Event::Browser::SavedTracksUpdated{}});
        REQUIRE(home->GetSavedTracks() == std::vector<SongDescription>{MakeSong("b"), MakeSong("a")});
    }
    SECTION("Playlists") {
        REQUIRE(browser.Apply(SetPlaylistsContent{{MakePlaylist("p1")}}) == Events{Event::Browser::SavedPlaylistsUpdated{}});
        REQUIRE(browser.Apply(PrependPlaylistsContent{{MakePlaylist("p2")}}) == Events{Event::Browser::SavedPlaylistsUpdated{}});
        REQUIRE(home->GetPlaylists().size() == 2);
        REQUIRE(home->GetPlaylists().front().Id == "p2");
    }
    SECTION("Renaming reaches every screen showing the playlist") {
        browser.Apply(SetPlaylistsContent{{MakePlaylist("p1", "Old")}});
        browser.Apply(Action::ViewPlaylist("p1"));

        REQUIRE(browser.Apply(UpdatePlaylistName{{"p1", "New"}}) == Events{Event::Browser::PlaylistRenamed{"p1"}, Event::Browser::PlaylistRenamed{"p1"}});
        REQUIRE(home->GetPlaylists().front().Title == "New");
        REQUIRE(static_cast<const PlaylistDetailsState &>(browser.GetCurrent()).GetTitle() == "New");

        REQUIRE(browser.Apply(UpdatePlaylistName{{"unknown", "Title"}}).empty());
    }
}

TEST_CASE("Browser without a Home screen", "[Browser]") {
    BrowserState browser{ScreenName::Search()};
    REQUIRE(browser.GetHome() == nullptr);
    REQUIRE(browser.Apply(SaveTracks{{MakeSong("a")}}).empty());

    browser.Apply(NavigationPush{ScreenName::Home()});
    REQUIRE(browser.GetHome() != nullptr);

    SECTION("A const browser only hands out a const Home screen") {
        const auto &const_browser = browser;
        static_assert(std::is_same_v<decltype(const_browser.GetHome()), const HomeState *>);
        REQUIRE(const_browser.GetHome() == browser.GetHome());
    }
}

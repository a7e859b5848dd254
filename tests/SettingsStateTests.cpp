#include "TestHelpers.h"

#include "State/Settings/SettingsState.h"

using Events = std::vector<Event::Settings::Any>;

TEST_CASE("Changing settings reports what changed", "[Settings]") {
    SettingsState settings;
    auto changed = settings.Get();

    SECTION("Nothing") {
        REQUIRE(settings.Apply(Action::Settings::ChangeSettings{changed}).empty());
    }
    SECTION("Theme") {
        changed.Theme = Theme::Dark;
        REQUIRE(settings.Apply(Action::Settings::ChangeSettings{changed}) == Events{Event::Settings::ThemeChanged{Theme::Dark}});
        REQUIRE(settings.Get().Theme == Theme::Dark);
    }
    SECTION("Player settings") {
        changed.Player.BitrateKbps = 320;
        REQUIRE(settings.Apply(Action::Settings::ChangeSettings{changed}) == Events{Event::Settings::PlayerSettingsChanged{}});
    }
    SECTION("Theme first, then player settings") {
        changed.Theme = Theme::Light;
        changed.Player.Gapless = false;
        REQUIRE(settings.Apply(Action::Settings::ChangeSettings{changed}) == Events{Event::Settings::ThemeChanged{Theme::Light}, Event::Settings::PlayerSettingsChanged{}});
    }
}

#include "BrowserState.h"

#include <algorithm>
#include <utility>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "Helper/Variant.h"

using std::vector;

namespace views = ranges::views;
using ranges::to;

namespace Events = Event::Browser;

BrowserState::BrowserState(ScreenName root) {
    Screens.emplace_back(CreateScreenState(root));
}

vector<BrowserState::EventType> BrowserState::Apply(const ActionType &action) {
    return std::visit(
        Match{
            [this](const Action::Browser::NavigationPush &a) { return Push(a.screen); },
            [this](const Action::Browser::NavigationPop &) -> vector<EventType> {
                if (Screens.size() <= 1) return {};
                Screens.pop_back();
                return {Events::NavigationPopped{}};
            },
            [this](const Action::Browser::NavigationPopTo &a) -> vector<EventType> {
                const auto it = std::ranges::find_if(Screens.rbegin(), Screens.rend(), [&a](const auto &screen) { return screen->Name == a.screen; });
                if (it == Screens.rend() || it == Screens.rbegin()) return {};
                Screens.erase(it.base(), Screens.end());
                return {Events::NavigationPoppedTo{a.screen}};
            },
            [this](const Action::Browser::Search &a) -> vector<EventType> {
                auto events = Push(ScreenName::Search());
                static_cast<SearchState &>(*Screens.back()).Query = a.query;
                events.emplace_back(Events::SearchUpdated{a.query});
                return events;
            },
            [this, &action](const auto &) { return Broadcast(action); },
        },
        action
    );
}

vector<BrowserState::EventType> BrowserState::Push(const ScreenName &name) {
    if (GetCurrent().Name == name) return {};
    Screens.emplace_back(CreateScreenState(name));
    return {Events::NavigationPushed{name}};
}

vector<BrowserState::EventType> BrowserState::Broadcast(const ActionType &action) {
    vector<EventType> events;
    for (const auto &screen : Screens) {
        auto screen_events = screen->Apply(action);
        events.insert(events.end(), std::make_move_iterator(screen_events.begin()), std::make_move_iterator(screen_events.end()));
    }
    return events;
}

const HomeState *BrowserState::GetHome() const {
    const auto it = std::ranges::find_if(Screens, [](const auto &screen) { return screen->Name.Kind == ScreenName::Type::Home; });
    if (it == Screens.end()) return nullptr;
    return static_cast<const HomeState *>(it->get());
}
HomeState *BrowserState::GetHome() { return const_cast<HomeState *>(std::as_const(*this).GetHome()); }

vector<ScreenName> BrowserState::GetNavigation() const {
    return Screens | views::transform([](const auto &screen) { return screen->Name; }) | to<vector>();
}

#pragma once

#include <memory>
#include <vector>

#include "ScreenState.h"

/**
The browser's navigation stack. The bottom screen is the root, and is never popped.
Navigation actions are handled here, and content actions are offered to every screen in stack order (root first).
*/
struct BrowserState : Actionable<Action::Browser::Any, Event::Browser::Any> {
    BrowserState(ScreenName root = ScreenName::Home());

    std::vector<EventType> Apply(const ActionType &) override;

    // The Home screen, if it is anywhere in the stack.
    const HomeState *GetHome() const;
    HomeState *GetHome();

    const ScreenState &GetCurrent() const { return *Screens.back(); }
    Count GetDepth() const { return Screens.size(); }
    std::vector<ScreenName> GetNavigation() const;

private:
    std::vector<EventType> Push(const ScreenName &);
    std::vector<EventType> Broadcast(const ActionType &);

    std::vector<std::unique_ptr<ScreenState>> Screens;
};

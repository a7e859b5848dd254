#pragma once

#include <vector>

// The update contract of a substate (or a sub-view of one):
// apply one of its own actions, and report what changed as an ordered list of its own events.
template<typename A, typename E> struct Actionable {
    using ActionType = A;
    using EventType = E;

    virtual ~Actionable() = default;

    virtual std::vector<EventType> Apply(const ActionType &) = 0;
};

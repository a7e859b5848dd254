#pragma once

#include <deque>
#include <vector>

#include "AppState.h"
#include "Core/Action/ActionQueue.h"
#include "Core/Event/EventListener.h"

struct DispatcherConfig {
    Count HistoryCapacity{256};
};

using AppActionMoment = ActionMoment<Action::Any>;

struct ActionRecord {
    AppActionMoment Moment;
    TimePoint ApplyTime;
    Count EventCount;
};

Json(AppActionMoment, Action, QueueTime);
Json(ActionRecord, Moment, ApplyTime, EventCount);

/**
Owns the `AppState`, and is the only thing that applies actions to it.

Producers on any thread `Q` actions, which are applied in order (per producer) on the owning thread by `ApplyQueuedActions`.
The owning thread can also `Dispatch` an action directly, skipping the queue.
After each applied action, every listener is notified of each event it caused, in emission order.
*/
struct Dispatcher {
    using ListenerType = EventListener<Event::Any>;

    Dispatcher(DispatcherConfig = {}, AppState = {});

    // Thread-safe. Returns `false` if the action could not be queued.
    bool Q(Action::Any &&) const;

    // Owner thread only. Throws `PreconditionError` if the action can't be applied.
    std::vector<Event::Any> Dispatch(const Action::Any &);

    // Owner thread only. Apply all queued actions and return all of their events.
    // An action failing its preconditions is logged and skipped.
    std::vector<Event::Any> ApplyQueuedActions();

    void AddListener(ListenerType *) const;
    void RemoveListener(ListenerType *) const;

    const AppState &GetState() const { return State; }
    // Applied actions, oldest first.
    const std::deque<ActionRecord> &GetHistory() const { return History; }
    size_t QueuedCountApprox() const { return Queue.SizeApprox(); }

private:
    std::vector<Event::Any> Apply(AppActionMoment &&);

    DispatcherConfig Config;
    AppState State{};
    mutable ActionQueue<Action::Any> Queue{};
    std::deque<ActionRecord> History{};
    mutable std::vector<ListenerType *> Listeners{};
};

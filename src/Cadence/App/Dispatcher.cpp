#include "Dispatcher.h"

#include <algorithm>
#include <format>

#include "Core/Error.h"

#include "Core/Log.h"

using std::vector;

Dispatcher::Dispatcher(DispatcherConfig config, AppState state) : Config(std::move(config)), State(std::move(state)) {}

bool Dispatcher::Q(Action::Any &&action) const { return Queue.Enqueue(std::move(action)); }

vector<Event::Any> Dispatcher::Dispatch(const Action::Any &action) {
    return Apply({action, Clock::now()});
}

vector<Event::Any> Dispatcher::ApplyQueuedActions() {
    vector<Event::Any> all_events;
    AppActionMoment action_moment;
    while (Queue.TryDequeue(action_moment)) {
        const auto &name = action_moment.Action.GetName();
        try {
            auto events = Apply(std::move(action_moment));
            all_events.insert(all_events.end(), std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()));
        } catch (const PreconditionError &e) {
            Log(LogLevel::Error, std::format("{} failed: {}", name, e.what()));
        }
    }
    return all_events;
}

vector<Event::Any> Dispatcher::Apply(AppActionMoment &&action_moment) {
    auto events = State.Apply(action_moment.Action);
    LogIf(LogLevel::Debug, [&] { return std::format("{} ({} event(s), queued {} ago)", action_moment.Action.GetName(), events.size(), FormatElapsedMillis(action_moment.QueueTime)); });

    if (Config.HistoryCapacity > 0) {
        if (History.size() == Config.HistoryCapacity) History.pop_front();
        History.push_back({std::move(action_moment), Clock::now(), Count(events.size())});
    }

    // Listeners may add or remove listeners while being notified.
    for (const auto &event : events) {
        const auto listeners = Listeners;
        for (auto *listener : listeners) {
            if (std::ranges::find(Listeners, listener) != Listeners.end()) listener->OnEvent(event);
        }
    }
    return events;
}

void Dispatcher::AddListener(ListenerType *listener) const {
    if (std::ranges::find(Listeners, listener) == Listeners.end()) Listeners.push_back(listener);
}

void Dispatcher::RemoveListener(ListenerType *listener) const {
    std::erase(Listeners, listener);
}

#include "ActionQueue.h"

#include "concurrentqueue.h"

template<typename ActionType>
ActionQueue<ActionType>::ActionQueue()
    : Queue(std::make_unique<QueueType>()) {}

template<typename ActionType>
ActionQueue<ActionType>::~ActionQueue() = default;

template<typename ActionType>
bool ActionQueue<ActionType>::Enqueue(ActionMoment<ActionType> &&action_moment) {
    return Queue->enqueue(std::move(action_moment));
}

template<typename ActionType>
bool ActionQueue<ActionType>::Enqueue(ActionType &&action) {
    return Queue->enqueue(ActionMoment<ActionType>{std::move(action), Clock::now()});
}

template<typename ActionType>
bool ActionQueue<ActionType>::TryDequeue(ActionMoment<ActionType> &action_moment) {
    return Queue->try_dequeue(action_moment);
}

template<typename ActionType>
size_t ActionQueue<ActionType>::SizeApprox() const {
    return Queue->size_approx();
}

#include "App/AppAction.h"

// Explicit instantiation.
template struct ActionQueue<Action::Any>;

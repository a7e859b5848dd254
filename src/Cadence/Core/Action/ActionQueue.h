#pragma once

#include <memory>

#include "Core/Action/ActionMoment.h"

// Forward declaration of ConcurrentQueue
namespace moodycamel {
struct ConcurrentQueueDefaultTraits;
template<typename T, typename Traits> class ConcurrentQueue;
} // namespace moodycamel

// Multi-producer action queue.
// Any thread may `Enqueue`. Only the owning thread dequeues, and actions from a single producer come out in the order they went in.
template<typename ActionType> struct ActionQueue {
    ActionQueue();
    ~ActionQueue();

    bool Enqueue(ActionMoment<ActionType> &&);
    bool Enqueue(ActionType &&);
    bool TryDequeue(ActionMoment<ActionType> &);

    // Approximate when other threads are enqueueing.
    size_t SizeApprox() const;

private:
    using QueueType = moodycamel::ConcurrentQueue<ActionMoment<ActionType>, moodycamel::ConcurrentQueueDefaultTraits>;
    std::unique_ptr<QueueType> Queue;
};

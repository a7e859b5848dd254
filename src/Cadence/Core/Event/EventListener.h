#pragma once

// Called once per emitted event, in emission order, after the action that caused it has been fully applied.
template<typename EventType> struct EventListener {
    virtual ~EventListener() = default;
    virtual void OnEvent(const EventType &) = 0;
};

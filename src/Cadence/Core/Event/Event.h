#pragma once

#include "Core/Message.h"
#include "Core/Scalar.h"

/**
An event is an immutable record of a state change that already happened.
Applying an action returns the events it caused, in emission order.
Events are the only signal that state changed: nothing else should be inferred from applying an action.
*/
namespace Event {
template<IsMessage... T> using EventVariant = MessageVariant<T...>;
} // namespace Event

#define DefineEvent(EventType, ...)                                 \
    struct EventType {                                              \
        inline static const Metadata _Meta{_TypePath, #EventType};  \
        static const TypePath &GetPath() { return _Meta.Path; }     \
        static const std::string &GetName() { return _Meta.Name; }  \
        __VA_ARGS__;                                                \
        bool operator==(const EventType &) const = default;         \
    };

#define DefineEventType(TypePathName, ...)                         \
    namespace Event {                                              \
    namespace TypePathName {                                       \
    inline constexpr std::string_view _TypePath{#TypePathName};    \
    __VA_ARGS__;                                                   \
    }                                                              \
    }

#pragma once

#include "Core/Message.h"
#include "Core/Scalar.h"

/**
An action is an immutable representation of an intent to change application state.
Each action stores all information needed to apply it to an `AppState` (IDs, descriptions, contexts),
and never references into live state.

Actions are grouped into `ActionVariant`s, and thus the byte size of a group is large enough to hold its biggest type.
Note that adding static members does not increase the size of the variant(s) it belongs to.
*/
namespace Action {
template<IsMessage... T> using ActionVariant = MessageVariant<T...>;
} // namespace Action

// A set of macros for defining actions.
// Each action type is a struct in `Action::{TypePath}`, with JSON converters defined by `Json(ActionType, fields...)`.

#define DefineAction(ActionType, ...)                                         \
    struct ActionType {                                                       \
        inline static const Metadata _Meta{_TypePath, #ActionType};           \
        static const TypePath &GetPath() { return _Meta.Path; }               \
        static const std::string &GetName() { return _Meta.Name; }            \
        __VA_ARGS__;                                                          \
        bool operator==(const ActionType &) const = default;                  \
    };

#define DefineActionType(TypePathName, ...)                   \
    namespace Action {                                        \
    namespace TypePathName {                                  \
    inline constexpr std::string_view _TypePath{#TypePathName}; \
    __VA_ARGS__;                                              \
    }                                                         \
    }

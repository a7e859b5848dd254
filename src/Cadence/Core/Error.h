#pragma once

#include <stdexcept>
#include <string>

// A structural precondition of an action does not hold in the current state (e.g. a sub-view it targets is absent).
// Thrown before any state is mutated.
struct PreconditionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

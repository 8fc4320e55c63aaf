#pragma once

#include <stdexcept>
#include <string>

namespace hl::upload {

// Bad input detected before any worker starts (exit code 1).
struct SetupError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Broken internal state, e.g. a commit payload for a task that was never hashed.
// Stops the whole run instead of being retried.
struct InvariantViolation : std::logic_error {
    using std::logic_error::logic_error;
};

}

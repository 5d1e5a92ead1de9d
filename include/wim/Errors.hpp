#pragma once

#include <stdexcept>
#include <string>

namespace wim {

struct WimError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Update kind outside {add, delete, rename}, or a path the command syntax
// cannot quote. Raised before anything is spawned.
struct UnsupportedCommandError : WimError {
    using WimError::WimError;
};

struct MissingCommandError : WimError {
    using WimError::WimError;
};

// info/dir produced no output or exited non-zero.
struct RetrievalError : WimError {
    using WimError::WimError;
};

struct IntegrityError : WimError {
    using WimError::WimError;
};

struct CaptureError : WimError {
    using WimError::WimError;
};

struct ExtractError : WimError {
    using WimError::WimError;
};

struct UpdateError : WimError {
    using WimError::WimError;
};

} // namespace wim

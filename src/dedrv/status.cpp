#include "dedrv/state.h"
#include "dedrv/status.h"

namespace dedrv {

const char *toString(DriverError err) {
    switch (err) {
    case DriverError::NONE:
        return "none";
    case DriverError::UNKNOWN:
        return "unknown";
    case DriverError::INVALID_ARGUMENT:
        return "invalid argument";
    case DriverError::NOT_SUPPORTED:
        return "not supported";
    case DriverError::NOT_PRESENT:
        return "not present";
    case DriverError::TIMEOUT:
        return "timeout";
    case DriverError::BUSY:
        return "busy";
    case DriverError::IO_ERROR:
        return "io error";
    case DriverError::HARDWARE_FAULT:
        return "hardware fault";
    }
    return "?";
}

const char *toString(State state) {
    switch (state) {
    case State::UNINITIALIZED:
        return "uninitialized";
    case State::INITIALIZING:
        return "initializing";
    case State::READY:
        return "ready";
    case State::FAILED:
        return "failed";
    case State::CLEANING_UP:
        return "cleaning-up";
    case State::CLEANED:
        return "cleaned";
    }
    return "?";
}

} // namespace dedrv

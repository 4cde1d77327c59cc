#pragma once

#include "dedrv/result.h"
#include "dedrv/stdint.h"
#include "dedrv/strstream.h"

namespace dedrv {

/// @brief Failure codes a driver hook or operation can report
enum class DriverError : u8 {
    NONE,                   ///< No error (value of a fresh lifecycle slot)
    UNKNOWN,                ///< Unknown or unspecified error
    INVALID_ARGUMENT,       ///< Invalid argument or configuration
    NOT_SUPPORTED,          ///< Operation not supported by the hardware
    NOT_PRESENT,            ///< Peripheral did not answer / not fitted
    TIMEOUT,                ///< Operation timed out
    BUSY,                   ///< Resource is busy
    IO_ERROR,               ///< Bus or register access failed
    HARDWARE_FAULT          ///< Peripheral reported a fault condition
};

/// Result of a driver hook. Carries a DriverError and a static message on
/// failure.
typedef Result<void, DriverError> Status;

inline Status success() { return Status::success(); }

/// @param msg must be a string literal or otherwise outlive the boot sequence
inline Status failure(DriverError err, const char *msg = nullptr) {
    return Status::failure(err, msg);
}

const char *toString(DriverError err);

inline StrStream &operator<<(StrStream &out, DriverError err) {
    return out << toString(err);
}

} // namespace dedrv

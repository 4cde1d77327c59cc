#pragma once

#include "dedrv/status.h"
#include "dedrv/strstream.h"

namespace dedrv {

/// Lifecycle state of one device.
///
///   UNINITIALIZED -> INITIALIZING -> READY | FAILED
///   READY -> CLEANING_UP -> CLEANED | FAILED
///   UNINITIALIZED -> CLEANED (cleanup of a device that never booted)
///
/// FAILED and CLEANED are terminal for a boot/shutdown cycle.
enum class State : u8 {
    UNINITIALIZED = 0,
    INITIALIZING,
    READY,
    FAILED,
    CLEANING_UP,
    CLEANED
};

const char *toString(State state);

inline StrStream &operator<<(StrStream &out, State state) {
    return out << toString(state);
}

// Mutable per-device record referenced by a Descriptor. Lives in .bss so a
// reset leaves every device UNINITIALIZED. Written by the lifecycle manager
// inside critical sections only.
struct LifecycleSlot {
    volatile State state;
    DriverError cause;
    const char *message;
};

} // namespace dedrv

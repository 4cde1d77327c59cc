#pragma once

/// Shared/generic interrupt control interface for desktop platforms
/// Desktop platforms don't have hardware interrupts. The enable flag is
/// simulated so critical section nesting behaves (and can be observed) the
/// same way it does on a microcontroller.

#include "dedrv/stdint.h"

namespace dedrv {

typedef u8 InterruptState;

}  // namespace dedrv

#pragma once

/// AVR-specific interrupt control interface
/// Minimal bindings to the SREG global interrupt flag

#include "dedrv/stdint.h"

namespace dedrv {

/// Copy of SREG taken when a critical section is entered
typedef u8 InterruptState;

}  // namespace dedrv

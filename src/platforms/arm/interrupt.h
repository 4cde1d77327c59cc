#pragma once

/// ARM Cortex-M interrupt control interface
/// Minimal bindings using the PRIMASK register

#include "dedrv/stdint.h"

namespace dedrv {

/// Snapshot of PRIMASK taken when a critical section is entered
typedef u32 InterruptState;

}  // namespace dedrv

#pragma once

/// @file interrupt.h
/// Cross-platform interrupt enable/disable functionality
///
/// Usage:
/// @code
///     dedrv::InterruptState state = dedrv::saveAndDisableInterrupts();
///     // critical code
///     dedrv::restoreInterrupts(state);
/// @endcode
///
/// Prefer dedrv::CriticalSection (dedrv/critical_section.h), which restores
/// the saved state on every exit path.

#include "platforms/interrupt.h"

namespace dedrv {

/// Disable interrupts unconditionally
void noInterrupts();

/// Enable interrupts unconditionally
void interrupts();

/// Disable interrupts and return the previous enable state
InterruptState saveAndDisableInterrupts();

/// Restore a state returned by saveAndDisableInterrupts()
void restoreInterrupts(InterruptState state);

bool interruptsEnabled();

}  // namespace dedrv

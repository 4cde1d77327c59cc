/// Shared/generic interrupt control implementation for desktop platforms

#include "platforms/is_platform.h"

// Only compile this if no platform-specific implementation exists
#if !defined(DEDRV_IS_AVR) && !defined(DEDRV_IS_ARM_CORTEX_M)

#include "dedrv/interrupt.h"

namespace dedrv {

namespace {
volatile bool gInterruptsEnabled = true;
}  // namespace

void noInterrupts() {
    gInterruptsEnabled = false;
}

void interrupts() {
    gInterruptsEnabled = true;
}

InterruptState saveAndDisableInterrupts() {
    InterruptState previous = gInterruptsEnabled ? 1 : 0;
    gInterruptsEnabled = false;
    return previous;
}

void restoreInterrupts(InterruptState state) {
    gInterruptsEnabled = state != 0;
}

bool interruptsEnabled() {
    return gInterruptsEnabled;
}

}  // namespace dedrv

#endif  // Platform guards

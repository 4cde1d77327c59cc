/// AVR-specific interrupt control implementation

#ifdef __AVR__

#include <avr/interrupt.h>
#include <avr/io.h>

#include "dedrv/interrupt.h"

namespace dedrv {

void noInterrupts() {
    cli();
}

void interrupts() {
    sei();
}

InterruptState saveAndDisableInterrupts() {
    InterruptState sreg = SREG;
    cli();
    return sreg;
}

void restoreInterrupts(InterruptState state) {
    SREG = state;
}

bool interruptsEnabled() {
    return (SREG & (1 << SREG_I)) != 0;
}

}  // namespace dedrv

#endif  // __AVR__

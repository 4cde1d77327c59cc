/// ARM Cortex-M interrupt control implementation

#include "platforms/is_platform.h"

#ifdef DEDRV_IS_ARM_CORTEX_M

#include "dedrv/interrupt.h"

namespace dedrv {

void noInterrupts() {
    __asm__ __volatile__("cpsid i" ::: "memory");
}

void interrupts() {
    __asm__ __volatile__("cpsie i" ::: "memory");
}

InterruptState saveAndDisableInterrupts() {
    u32 primask;
    __asm__ __volatile__("mrs %0, primask\n\t"
                         "cpsid i"
                         : "=r"(primask)
                         :
                         : "memory");
    return primask;
}

void restoreInterrupts(InterruptState state) {
    __asm__ __volatile__("msr primask, %0" : : "r"(state) : "memory");
}

bool interruptsEnabled() {
    u32 primask;
    __asm__ __volatile__("mrs %0, primask" : "=r"(primask));
    return (primask & 1u) == 0;
}

}  // namespace dedrv

#endif  // DEDRV_IS_ARM_CORTEX_M

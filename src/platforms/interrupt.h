#pragma once

/// Platform-specific interrupt control implementation
/// This file dispatches to the appropriate platform-specific implementation

#include "platforms/is_platform.h"

#if defined(DEDRV_IS_AVR)
    #include "platforms/avr/interrupt.h"
#elif defined(DEDRV_IS_ARM_CORTEX_M)
    #include "platforms/arm/interrupt.h"
#else
    // Default platform (desktop/generic)
    #include "platforms/shared/interrupt.h"
#endif

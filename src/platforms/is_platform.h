#pragma once

/// @file is_platform.h
/// Platform detection used by the dispatch headers in this directory.
///
/// - DEDRV_IS_ARM_CORTEX_M: ARMv6-M / ARMv7-M / ARMv8-M cores (PRIMASK)
/// - DEDRV_IS_AVR: 8-bit AVR (SREG)
/// - otherwise: hosted or unknown target, interrupts are simulated

#if defined(__arm__) && defined(__ARM_ARCH_PROFILE) && (__ARM_ARCH_PROFILE == 'M')
#define DEDRV_IS_ARM_CORTEX_M 1
#elif defined(__AVR__)
#define DEDRV_IS_AVR 1
#endif

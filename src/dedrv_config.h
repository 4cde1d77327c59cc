#pragma once

/// @file dedrv_config.h
/// Compile time configuration of dedrv. Every option may be overridden on the
/// compiler command line (-DDEDRV_MAX_DEVICES=64) or by defining it before the
/// first dedrv include.

// Capacity of the priority ordered boot sequence and of the failure list kept
// by a LifecycleManager. Registries holding more devices are rejected at boot.
// #define DEDRV_MAX_DEVICES 32

// Failure policy applied by default when a device init or cleanup hook fails.
// DEDRV_POLICY_ABORT_ALL stops the pass at the first failure,
// DEDRV_POLICY_CONTINUE records the failure and moves on.
// #define DEDRV_DEFAULT_FAILURE_POLICY DEDRV_POLICY_CONTINUE

// Input section prefix used by DEDRV_DEVICE. Must match the linker fragment.
// #define DEDRV_DEVICE_SECTION_PREFIX ".dedrv.device."

// Size of the inline buffer used to format log lines.
// #define DEDRV_STRSTREAM_CAPACITY 128

// Enable the category loggers.
// #define DEDRV_LOG_LIFECYCLE_ENABLED
// #define DEDRV_LOG_REGISTRY_ENABLED

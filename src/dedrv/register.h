#pragma once

/// @file register.h
/// @brief Static device registration
///
/// DEDRV_DEVICE(VAR, PATH, PRIORITY) places a Descriptor for the static
/// device VAR into its own `.dedrv.device.VAR` input section. The linker
/// fragment in linker/ collects those sections into one region bracketed by
/// the registry markers; see dedrv/registry.h.
///
/// @code
/// static dedrv::Device<GpioDriver> gpio0(GpioDriver::ConfigType{0x48000000});
/// DEDRV_DEVICE(gpio0, "/gpio0", 10);
/// @endcode
///
/// Lower PRIORITY initializes earlier. PATH must be unique within the
/// binary; duplicates are rejected by the lifecycle manager before any hook
/// runs.

#include "dedrv/compiler_control.h"
#include "dedrv/config.h"
#include "dedrv/descriptor.h"
#include "dedrv/device.h"
#include "dedrv/state.h"
#include "dedrv/type_traits.h"

#define DEDRV_DEVICE(VAR, PATH, PRIORITY)                                      \
    static_assert(::dedrv::is_device<decltype(VAR)>::value,                    \
                  "DEDRV_DEVICE: " #VAR " is not a dedrv::Device<Driver>");    \
    static_assert(sizeof(PATH) > 1, "DEDRV_DEVICE: empty path for " #VAR);     \
    static ::dedrv::LifecycleSlot DEDRV_CONCAT(dedrv_slot_, VAR);              \
    DEDRV_USED DEDRV_SECTION(DEDRV_DEVICE_SECTION_PREFIX #VAR)                 \
    DEDRV_ALIGNED(alignof(::dedrv::Descriptor))                                \
    static constexpr ::dedrv::Descriptor DEDRV_CONCAT(dedrv_desc_, VAR) =      \
        ::dedrv::make_descriptor(PATH, PRIORITY, VAR,                          \
                                 DEDRV_CONCAT(dedrv_slot_, VAR))

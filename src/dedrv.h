#pragma once

/// @file dedrv.h
/// Central include file for dedrv: statically registered devices with an
/// ordered boot and shutdown sequence.
///
/// @code
/// #include "dedrv.h"
///
/// static dedrv::Device<GpioDriver> gpio0(GpioDriver::ConfigType{0x48000000});
/// DEDRV_DEVICE(gpio0, "/gpio0", 10);
///
/// int main() {
///     dedrv::Report boot = dedrv::init();
///     if (!boot.ok()) {
///         boot.describe();
///     }
///     ...
///     dedrv::Report shutdown = dedrv::cleanup();
/// }
/// @endcode

/// Current dedrv version number, as an integer: 1 digit major, 3 digits
/// minor, 3 digits patch.
#define DEDRV_VERSION 1000000

#include "dedrv/config.h"

#include "dedrv/critical_section.h"
#include "dedrv/descriptor.h"
#include "dedrv/device.h"
#include "dedrv/driver.h"
#include "dedrv/error.h"
#include "dedrv/lifecycle.h"
#include "dedrv/lookup.h"
#include "dedrv/mutex.h"
#include "dedrv/register.h"
#include "dedrv/registry.h"
#include "dedrv/report.h"
#include "dedrv/status.h"
#include "dedrv/warn.h"

namespace dedrv {

/// Process-wide manager over Registry::linked(), created on first use.
LifecycleManager &manager();

/// manager().init()
DEDRV_NODISCARD Report init();

/// manager().cleanup()
DEDRV_NODISCARD Report cleanup();

/// Looks `path` up in the linked registry.
Optional<DeviceRef> find(const char *path);

} // namespace dedrv

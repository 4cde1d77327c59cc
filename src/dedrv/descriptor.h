#pragma once

#include "dedrv/compiler_control.h"
#include "dedrv/state.h"
#include "dedrv/status.h"
#include "dedrv/stdint.h"
#include "dedrv/type_traits.h"

namespace dedrv {

/// Hook stored in a descriptor. Receives the registered device instance.
typedef Status (*HookFn)(void *device);

/// One registered device, as laid out in the `.dedrv.device.*` input
/// sections.
///
/// The linker collects every descriptor of a binary into one contiguous
/// region that the Registry reinterprets as an array, so the layout is part
/// of the ABI between translation units: seven pointer-sized fields, aligned
/// to a pointer (28 bytes on 32-bit targets, 56 bytes on 64-bit hosts).
/// Anything device specific is reached through `device` and `slot`.
struct Descriptor {
    const char *path;      ///< unique identifier, e.g. "/gpio0"
    iptr priority;         ///< ascending init order, reverse cleanup order
    void *device;          ///< the static device instance
    const void *type;      ///< type_id<DeviceT>() of *device
    HookFn init;
    HookFn cleanup;
    LifecycleSlot *slot;   ///< mutable lifecycle record of the device
};

static_assert(sizeof(HookFn) == sizeof(void *),
              "descriptor hooks must be pointer sized on this target");
static_assert(sizeof(Descriptor) == 7 * sizeof(void *),
              "Descriptor layout changed: update the linker fragments");
static_assert(alignof(Descriptor) == alignof(void *),
              "Descriptor must be pointer aligned");
static_assert(is_standard_layout<Descriptor>::value,
              "Descriptor must be standard layout");
static_assert(is_trivially_destructible<Descriptor>::value,
              "Descriptor must be trivially destructible");

/// Unique per-type address, used in place of RTTI to check lookups.
template <typename T> struct TypeTag {
    static const char id;
};
template <typename T> const char TypeTag<T>::id = 0;

template <typename T> constexpr const void *type_id() {
    return &TypeTag<T>::id;
}

namespace detail {

template <typename DeviceT> Status init_hook(void *device) {
    return static_cast<DeviceT *>(device)->init();
}

template <typename DeviceT> Status cleanup_hook(void *device) {
    return static_cast<DeviceT *>(device)->cleanup();
}

} // namespace detail

/// Builds the descriptor of `device`. Usable in constant expressions, which
/// is what lets DEDRV_DEVICE emit it as initialized data.
///
/// DeviceT needs `Status init()` and `Status cleanup()`.
template <typename DeviceT>
constexpr Descriptor make_descriptor(const char *path, iptr priority,
                                     DeviceT &device, LifecycleSlot &slot) {
    return Descriptor{path,
                      priority,
                      &device,
                      type_id<DeviceT>(),
                      &detail::init_hook<DeviceT>,
                      &detail::cleanup_hook<DeviceT>,
                      &slot};
}

/// Identifier equality (content comparison, ids are not interned across
/// translation units).
inline bool samePath(const char *a, const char *b) {
    if (a == b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    while (*a && *a == *b) {
        ++a;
        ++b;
    }
    return *a == *b;
}

} // namespace dedrv

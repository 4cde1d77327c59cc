#pragma once

#include "dedrv/descriptor.h"
#include "dedrv/optional.h"
#include "dedrv/registry.h"
#include "dedrv/state.h"
#include "dedrv/status.h"
#include "dedrv/stdint.h"

namespace dedrv {

/// Handle to a registered device, returned by find().
///
/// Does not own anything: descriptors and devices are statics that live for
/// the whole program.
class DeviceRef {
  public:
    constexpr DeviceRef() : mDescriptor(nullptr) {}
    explicit constexpr DeviceRef(const Descriptor *descriptor) : mDescriptor(descriptor) {}

    const char *path() const;
    iptr priority() const;

    /// Current lifecycle state, read inside a critical section.
    State state() const;
    bool isReady() const { return state() == State::READY; }

    /// Cause of the last failed hook, DriverError::NONE if none failed.
    DriverError lastError() const;
    const char *lastMessage() const;

    /// The device as its concrete type, nullptr if it is not a DeviceT.
    ///
    /// @code
    /// auto ref = dedrv::find("/gpio0");
    /// if (ref) {
    ///     if (auto *gpio = ref->as<dedrv::Device<GpioDriver> >()) { ... }
    /// }
    /// @endcode
    template <typename DeviceT> DeviceT *as() const {
        if (!mDescriptor || mDescriptor->type != type_id<DeviceT>()) {
            return nullptr;
        }
        return static_cast<DeviceT *>(mDescriptor->device);
    }

    const Descriptor *descriptor() const { return mDescriptor; }

    bool operator==(const DeviceRef &other) const { return mDescriptor == other.mDescriptor; }
    bool operator!=(const DeviceRef &other) const { return mDescriptor != other.mDescriptor; }

  private:
    const Descriptor *mDescriptor;
};

/// Finds the device registered under `path`. Empty when no descriptor
/// matches, and on an invalid registry.
Optional<DeviceRef> find(const Registry &registry, const char *path);

} // namespace dedrv

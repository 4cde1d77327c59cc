#include "dedrv/lookup.h"

#include "dedrv/critical_section.h"
#include "dedrv/error.h"
#include "dedrv/log.h"

namespace dedrv {

const char *DeviceRef::path() const {
    return mDescriptor ? mDescriptor->path : nullptr;
}

iptr DeviceRef::priority() const {
    return mDescriptor ? mDescriptor->priority : 0;
}

State DeviceRef::state() const {
    if (!mDescriptor || !mDescriptor->slot) {
        return State::UNINITIALIZED;
    }
    CriticalSection cs;
    return mDescriptor->slot->state;
}

DriverError DeviceRef::lastError() const {
    if (!mDescriptor || !mDescriptor->slot) {
        return DriverError::NONE;
    }
    CriticalSection cs;
    return mDescriptor->slot->cause;
}

const char *DeviceRef::lastMessage() const {
    if (!mDescriptor || !mDescriptor->slot) {
        return "";
    }
    CriticalSection cs;
    const char *message = mDescriptor->slot->message;
    return message ? message : "";
}

Optional<DeviceRef> find(const Registry &registry, const char *path) {
    Result<void, LayoutError> layout = registry.validate();
    if (!layout.ok()) {
        DEDRV_ERROR("lookup of " << path << " on invalid registry: " << layout.error());
        return nullopt;
    }
    Registry::Entries entries = registry.entries();
    for (Registry::iterator it = entries.begin(); it != entries.end(); ++it) {
        if (samePath(it->path, path)) {
            return DeviceRef(it);
        }
    }
    DEDRV_LOG_REGISTRY("no device registered as " << path);
    return nullopt;
}

} // namespace dedrv

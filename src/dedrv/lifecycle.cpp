#include "dedrv/lifecycle.h"

#include "dedrv/assert.h"
#include "dedrv/critical_section.h"
#include "dedrv/error.h"
#include "dedrv/log.h"
#include "dedrv/state.h"
#include "dedrv/warn.h"

namespace dedrv {

const char *toString(FailurePolicy policy) {
    return policy == FailurePolicy::CONTINUE ? "continue" : "abort-all";
}

Optional<FailurePolicy> parseFailurePolicy(const char *text) {
    if (samePath(text, "abort-all")) {
        return FailurePolicy::ABORT_ALL;
    }
    if (samePath(text, "continue")) {
        return FailurePolicy::CONTINUE;
    }
    return nullopt;
}

const char *toString(LifecycleManager::Phase phase) {
    switch (phase) {
    case LifecycleManager::IDLE:
        return "idle";
    case LifecycleManager::BOOTED:
        return "booted";
    case LifecycleManager::SHUT_DOWN:
        return "shut down";
    }
    return "unknown";
}

LifecycleManager::LifecycleManager()
    : LifecycleManager(Registry::linked(), defaultPolicy()) {}

LifecycleManager::LifecycleManager(const Registry &registry, FailurePolicy policy)
    : mRegistry(registry), mPolicy(policy), mPhase(IDLE), mOrdered(false) {}

FailurePolicy LifecycleManager::defaultPolicy() {
#if DEDRV_DEFAULT_FAILURE_POLICY == DEDRV_POLICY_CONTINUE
    return FailurePolicy::CONTINUE;
#else
    return FailurePolicy::ABORT_ALL;
#endif
}

const Descriptor *LifecycleManager::ordered(dedrv::size index) const {
    return index < mOrder.size() ? mOrder[index] : nullptr;
}

Optional<DeviceRef> LifecycleManager::find(const char *path) const {
    return dedrv::find(mRegistry, path);
}

bool LifecycleManager::prepare(Report &report) {
    if (mOrdered) {
        return true;
    }
    Result<void, LayoutError> layout = mRegistry.validate();
    if (!layout.ok()) {
        report.setLayoutError(layout.error());
        DEDRV_ERROR("device registry: " << layout.message() << ": " << layout.error());
        return false;
    }

    Registry::Entries entries = mRegistry.entries();
    if (entries.size() > DEDRV_MAX_DEVICES) {
        report.setFatal(ErrorKind::TOO_MANY_DEVICES);
        DEDRV_ERROR(entries.size() << " devices registered, DEDRV_MAX_DEVICES is "
                                   << int(DEDRV_MAX_DEVICES));
        return false;
    }

    // Single pass: reject duplicates and insert in priority order. Equal
    // priorities keep link order.
    Order order;
    for (Registry::iterator desc = entries.begin(); desc != entries.end(); ++desc) {
        for (Order::iterator it = order.begin(); it != order.end(); ++it) {
            if (samePath((*it)->path, desc->path)) {
                report.setDuplicate(desc->path);
                DEDRV_ERROR("device " << desc->path << " registered twice");
                return false;
            }
        }
        dedrv::size pos = order.size();
        while (pos > 0 && order[pos - 1]->priority > desc->priority) {
            --pos;
        }
        bool inserted = order.insert(pos, desc);
        DEDRV_ASSERT(inserted, "device order overflow at " << desc->path);
    }
    mOrder = order;
    mOrdered = true;
    return true;
}

bool LifecycleManager::initOne(const Descriptor &desc, Report &report) {
    LifecycleSlot &slot = *desc.slot;
    Status status;
    {
        CriticalSection cs;
        // Slots outlive managers: another manager over the same descriptors
        // may already have run this hook.
        if (slot.state != State::UNINITIALIZED) {
            State seen = slot.state;
            report.recordOutcome(desc.path, Action::ALREADY_INITIALIZED);
            DEDRV_LOG_LIFECYCLE("init " << desc.path << ": skipped, " << seen);
            return true;
        }
        slot.state = State::INITIALIZING;
        status = desc.init(desc.device);
        if (status.ok()) {
            slot.state = State::READY;
            slot.cause = DriverError::NONE;
            slot.message = nullptr;
        } else {
            slot.state = State::FAILED;
            slot.cause = status.error();
            slot.message = status.message();
        }
    }
    if (status.ok()) {
        report.recordOutcome(desc.path, Action::INITIALIZED);
        DEDRV_LOG_LIFECYCLE("init " << desc.path << " (priority " << desc.priority << "): ready");
        return true;
    }
    report.recordOutcome(desc.path, Action::FAILED);
    report.recordFailure(desc.path, status);
    DEDRV_WARN("init " << desc.path << " failed: " << status.error() << " "
                       << status.message());
    return false;
}

bool LifecycleManager::cleanupOne(const Descriptor &desc, Report &report) {
    LifecycleSlot &slot = *desc.slot;
    Status status;
    bool ran = false;
    {
        CriticalSection cs;
        if (slot.state == State::READY) {
            slot.state = State::CLEANING_UP;
            status = desc.cleanup(desc.device);
            ran = true;
            if (status.ok()) {
                slot.state = State::CLEANED;
                slot.cause = DriverError::NONE;
                slot.message = nullptr;
            } else {
                slot.state = State::FAILED;
                slot.cause = status.error();
                slot.message = status.message();
            }
        } else if (slot.state == State::UNINITIALIZED) {
            slot.state = State::CLEANED;
        }
    }
    if (!ran) {
        report.recordOutcome(desc.path, Action::ALREADY_CLEAN);
        DEDRV_LOG_LIFECYCLE("cleanup " << desc.path << ": already clean");
        return true;
    }
    if (status.ok()) {
        report.recordOutcome(desc.path, Action::CLEANED);
        DEDRV_LOG_LIFECYCLE("cleanup " << desc.path << ": cleaned");
        return true;
    }
    report.recordOutcome(desc.path, Action::FAILED);
    report.recordFailure(desc.path, status);
    DEDRV_WARN("cleanup " << desc.path << " failed: " << status.error() << " "
                          << status.message());
    return false;
}

Report LifecycleManager::init() {
    Report report(Pass::INIT);
    if (mPhase != IDLE) {
        report.setFatal(ErrorKind::ALREADY_INITIALIZED);
        DEDRV_WARN("init called while " << toString(mPhase));
        return report;
    }
    if (!prepare(report)) {
        return report;
    }
    mPhase = BOOTED;
    for (Order::const_iterator it = mOrder.begin(); it != mOrder.end(); ++it) {
        if (!initOne(**it, report) && mPolicy == FailurePolicy::ABORT_ALL) {
            break;
        }
    }
    return report;
}

Report LifecycleManager::cleanup() {
    Report report(Pass::CLEANUP);
    if (!prepare(report)) {
        return report;
    }
    mPhase = SHUT_DOWN;
    for (Order::const_iterator it = mOrder.end(); it != mOrder.begin();) {
        --it;
        if (!cleanupOne(**it, report) && mPolicy == FailurePolicy::ABORT_ALL) {
            break;
        }
    }
    return report;
}

} // namespace dedrv

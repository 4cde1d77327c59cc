#pragma once

#include "dedrv/compiler_control.h"
#include "dedrv/config.h"
#include "dedrv/descriptor.h"
#include "dedrv/fixed_vector.h"
#include "dedrv/lookup.h"
#include "dedrv/optional.h"
#include "dedrv/registry.h"
#include "dedrv/report.h"
#include "dedrv/stdint.h"

namespace dedrv {

/// What a hook failure does to the rest of a pass.
enum class FailurePolicy : u8 {
    ABORT_ALL = DEDRV_POLICY_ABORT_ALL,  ///< stop at the first failure
    CONTINUE = DEDRV_POLICY_CONTINUE     ///< run every hook, collect failures
};

const char *toString(FailurePolicy policy);

/// "abort-all" or "continue"; empty for anything else.
Optional<FailurePolicy> parseFailurePolicy(const char *text);

/// Boots and shuts down the devices of a registry.
///
/// init() runs the init hooks in ascending priority (ties keep link
/// order); cleanup() runs the cleanup hooks in the exact reverse of that
/// order, and only for devices that reached READY. Each hook runs inside a
/// critical section.
///
/// @code
/// dedrv::LifecycleManager manager(dedrv::Registry::linked());
/// dedrv::Report boot = manager.init();
/// if (!boot.ok()) {
///     boot.describe();
/// }
/// @endcode
class LifecycleManager {
  public:
    enum Phase { IDLE, BOOTED, SHUT_DOWN };

    /// Manager of the linked registry with the default policy.
    LifecycleManager();
    explicit LifecycleManager(const Registry &registry,
                              FailurePolicy policy = defaultPolicy());

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

    /// DEDRV_DEFAULT_FAILURE_POLICY
    static FailurePolicy defaultPolicy();

    /// Validates the registry, orders it and runs the init hooks. A second
    /// call fails with ErrorKind::ALREADY_INITIALIZED and runs nothing.
    DEDRV_NODISCARD Report init();

    /// Runs the cleanup hooks of READY devices in reverse init order.
    /// Devices that are not READY are reported ALREADY_CLEAN, so cleanup
    /// may be called any number of times.
    DEDRV_NODISCARD Report cleanup();

    Optional<DeviceRef> find(const char *path) const;

    const Registry &registry() const { return mRegistry; }
    FailurePolicy policy() const { return mPolicy; }
    void setPolicy(FailurePolicy policy) { mPolicy = policy; }
    Phase phase() const { return mPhase; }

    /// Init order, valid once init() or cleanup() got past validation.
    dedrv::size orderedCount() const { return mOrder.size(); }
    const Descriptor *ordered(dedrv::size index) const;

  private:
    typedef FixedVector<const Descriptor *, DEDRV_MAX_DEVICES> Order;

    // Validates the registry and builds mOrder. Fatal errors are written to
    // `report`; returns false if no hook may run.
    bool prepare(Report &report);
    bool initOne(const Descriptor &desc, Report &report);
    bool cleanupOne(const Descriptor &desc, Report &report);

    Registry mRegistry;
    FailurePolicy mPolicy;
    Phase mPhase;
    bool mOrdered;
    Order mOrder;
};

const char *toString(LifecycleManager::Phase phase);

} // namespace dedrv

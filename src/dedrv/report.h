#pragma once

#include "dedrv/compiler_control.h"
#include "dedrv/config.h"
#include "dedrv/fixed_vector.h"
#include "dedrv/io.h"
#include "dedrv/registry.h"
#include "dedrv/status.h"
#include "dedrv/stdint.h"
#include "dedrv/strstream.h"

namespace dedrv {

/// Overall failure of a lifecycle pass.
enum class ErrorKind : u8 {
    NONE,
    LAYOUT,               ///< descriptor region failed validation
    DUPLICATE_ID,         ///< two descriptors share a path
    TOO_MANY_DEVICES,     ///< more descriptors than DEDRV_MAX_DEVICES
    ALREADY_INITIALIZED,  ///< init() called a second time
    INIT_FAILED,          ///< at least one init hook failed
    CLEANUP_FAILED        ///< at least one cleanup hook failed
};

const char *toString(ErrorKind kind);

inline StrStream &operator<<(StrStream &out, ErrorKind kind) {
    return out << toString(kind);
}

enum class Pass : u8 { INIT, CLEANUP };

const char *toString(Pass pass);

/// What happened to one device during a pass.
enum class Action : u8 {
    INITIALIZED,
    CLEANED,
    FAILED,
    ALREADY_CLEAN,       ///< cleanup skipped, the device was not READY
    ALREADY_INITIALIZED  ///< init skipped, the device was not UNINITIALIZED
};

const char *toString(Action action);

struct Outcome {
    const char *path;
    Action action;
};

/// A hook failure, attributed to its device.
struct DeviceFailure {
    const char *path;
    DriverError cause;
    const char *message;
};

/// Result of LifecycleManager::init() / cleanup().
///
/// Fatal errors (LAYOUT, DUPLICATE_ID, TOO_MANY_DEVICES,
/// ALREADY_INITIALIZED) are detected before any hook runs, so outcomes()
/// is empty for them. Hook failures are all collected, in execution order.
class Report {
  public:
    typedef FixedVector<Outcome, DEDRV_MAX_DEVICES> Outcomes;
    typedef FixedVector<DeviceFailure, DEDRV_MAX_DEVICES> Failures;

    explicit Report(Pass pass);

    bool ok() const { return mKind == ErrorKind::NONE; }
    bool fatal() const;
    ErrorKind error() const { return mKind; }
    Pass pass() const { return mPass; }

    /// Only meaningful when error() == ErrorKind::LAYOUT
    const LayoutError &layoutError() const { return mLayout; }
    /// Only meaningful when error() == ErrorKind::DUPLICATE_ID
    const char *duplicatePath() const { return mDuplicate; }

    const Outcomes &outcomes() const { return mOutcomes; }
    const Failures &failures() const { return mFailures; }

    /// Failure recorded for `path`, nullptr if it did not fail.
    const DeviceFailure *failureOf(const char *path) const;

    /// Receives one rendered line of describe().
    typedef void (*LineSink)(const char *line);

    /// "init: init failed (2 devices)"
    void summarize(StrStream &out) const;

    /// "  /b: timeout (no answer)" for failures()[index].
    void describeFailure(dedrv::size index, StrStream &out) const;

    /// Summary line, then one line per failed device. Every line is
    /// rendered on its own, so a long report loses no device.
    void describe(LineSink sink = &dedrv::println) const;

    // Filled in by the lifecycle manager.
    void setFatal(ErrorKind kind);
    void setLayoutError(const LayoutError &err);
    void setDuplicate(const char *path);
    void recordOutcome(const char *path, Action action);
    void recordFailure(const char *path, const Status &status);

  private:
    Pass mPass;
    ErrorKind mKind;
    LayoutError mLayout;
    const char *mDuplicate;
    Outcomes mOutcomes;
    Failures mFailures;
};

StrStream &operator<<(StrStream &out, const Report &report);

} // namespace dedrv

#include "dedrv/report.h"

#include "dedrv/assert.h"
#include "dedrv/descriptor.h"

namespace dedrv {

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return "ok";
    case ErrorKind::LAYOUT:
        return "layout error";
    case ErrorKind::DUPLICATE_ID:
        return "duplicate id";
    case ErrorKind::TOO_MANY_DEVICES:
        return "too many devices";
    case ErrorKind::ALREADY_INITIALIZED:
        return "already initialized";
    case ErrorKind::INIT_FAILED:
        return "init failed";
    case ErrorKind::CLEANUP_FAILED:
        return "cleanup failed";
    }
    return "unknown";
}

const char *toString(Pass pass) {
    return pass == Pass::INIT ? "init" : "cleanup";
}

const char *toString(Action action) {
    switch (action) {
    case Action::INITIALIZED:
        return "initialized";
    case Action::CLEANED:
        return "cleaned";
    case Action::FAILED:
        return "failed";
    case Action::ALREADY_CLEAN:
        return "already clean";
    case Action::ALREADY_INITIALIZED:
        return "already initialized";
    }
    return "unknown";
}

Report::Report(Pass pass)
    : mPass(pass), mKind(ErrorKind::NONE), mLayout(), mDuplicate(nullptr) {}

bool Report::fatal() const {
    switch (mKind) {
    case ErrorKind::LAYOUT:
    case ErrorKind::DUPLICATE_ID:
    case ErrorKind::TOO_MANY_DEVICES:
    case ErrorKind::ALREADY_INITIALIZED:
        return true;
    default:
        return false;
    }
}

const DeviceFailure *Report::failureOf(const char *path) const {
    return mFailures.find_if(
        [path](const DeviceFailure &f) { return samePath(f.path, path); });
}

void Report::setFatal(ErrorKind kind) { mKind = kind; }

void Report::setLayoutError(const LayoutError &err) {
    mKind = ErrorKind::LAYOUT;
    mLayout = err;
}

void Report::setDuplicate(const char *path) {
    mKind = ErrorKind::DUPLICATE_ID;
    mDuplicate = path;
}

void Report::recordOutcome(const char *path, Action action) {
    Outcome outcome;
    outcome.path = path;
    outcome.action = action;
    // The manager rejects more than DEDRV_MAX_DEVICES descriptors up front.
    bool recorded = mOutcomes.push_back(outcome);
    DEDRV_ASSERT(recorded, "outcome list full at " << path);
}

void Report::recordFailure(const char *path, const Status &status) {
    DeviceFailure failure;
    failure.path = path;
    failure.cause = status.error();
    failure.message = status.message();
    bool recorded = mFailures.push_back(failure);
    DEDRV_ASSERT(recorded, "failure list full at " << path);
    if (mKind == ErrorKind::NONE) {
        mKind = mPass == Pass::INIT ? ErrorKind::INIT_FAILED : ErrorKind::CLEANUP_FAILED;
    }
}

void Report::summarize(StrStream &out) const {
    out << toString(mPass) << ": " << mKind;
    switch (mKind) {
    case ErrorKind::LAYOUT:
        out << ": " << mLayout;
        break;
    case ErrorKind::DUPLICATE_ID:
        out << ": " << mDuplicate;
        break;
    case ErrorKind::TOO_MANY_DEVICES:
        out << " (max " << int(DEDRV_MAX_DEVICES) << ")";
        break;
    default:
        break;
    }
    if (!mFailures.empty()) {
        out << " (" << mFailures.size()
            << (mFailures.size() == 1 ? " device)" : " devices)");
    }
}

void Report::describeFailure(dedrv::size index, StrStream &out) const {
    const DeviceFailure &failure = mFailures[index];
    out << "  " << failure.path << ": " << failure.cause;
    if (failure.message && *failure.message) {
        out << " (" << failure.message << ")";
    }
}

void Report::describe(LineSink sink) const {
    {
        StrStream line;
        summarize(line);
        sink(line.c_str());
    }
    for (dedrv::size i = 0; i < mFailures.size(); ++i) {
        StrStream line;
        describeFailure(i, line);
        sink(line.c_str());
    }
}

StrStream &operator<<(StrStream &out, const Report &report) {
    report.summarize(out);
    return out;
}

} // namespace dedrv

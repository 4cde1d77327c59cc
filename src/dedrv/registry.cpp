#include "dedrv/registry.h"

#include "dedrv/log.h"

namespace dedrv {

const char *toString(LayoutFault fault) {
    switch (fault) {
    case LayoutFault::NONE:
        return "none";
    case LayoutFault::MISSING_MARKER:
        return "missing marker";
    case LayoutFault::END_BEFORE_START:
        return "end before start";
    case LayoutFault::MISALIGNED:
        return "misaligned start";
    case LayoutFault::SIZE_NOT_MULTIPLE:
        return "size not a multiple of the descriptor size";
    case LayoutFault::TERMINAL_MISMATCH:
        return "terminal marker mismatch";
    }
    return "unknown";
}

StrStream &operator<<(StrStream &out, const LayoutError &err) {
    out << toString(err.fault) << " (start=" << reinterpret_cast<const void *>(err.start)
        << " end=" << reinterpret_cast<const void *>(err.end);
    if (err.terminal) {
        out << " terminal=" << reinterpret_cast<const void *>(err.terminal);
    }
    return out << ")";
}

Registry Registry::linked() {
    return Registry(__DEDRV_MARKER_DEVICE_START, __DEDRV_MARKER_DEVICE_END,
                    __DEDRV_MARKER_DEVICE_TERMINAL);
}

LayoutError Registry::layoutError(LayoutFault fault) const {
    LayoutError err;
    err.fault = fault;
    err.start = reinterpret_cast<uptr>(mStart);
    err.end = reinterpret_cast<uptr>(mEnd);
    err.terminal = reinterpret_cast<uptr>(mTerminal);
    return err;
}

Result<void, LayoutError> Registry::validate() const {
    typedef Result<void, LayoutError> R;
    if (!mStart && !mEnd) {
        // No region linked in: nothing registered.
        if (mTerminal) {
            return R::failure(layoutError(LayoutFault::TERMINAL_MISMATCH),
                              "terminal marker without a region");
        }
        return R::success();
    }
    if (!mStart || !mEnd) {
        return R::failure(layoutError(LayoutFault::MISSING_MARKER),
                          "descriptor region has only one boundary");
    }
    const uptr start = reinterpret_cast<uptr>(mStart);
    const uptr end = reinterpret_cast<uptr>(mEnd);
    if (end < start) {
        return R::failure(layoutError(LayoutFault::END_BEFORE_START),
                          "descriptor region ends before it starts");
    }
    if (start % alignof(Descriptor) != 0) {
        return R::failure(layoutError(LayoutFault::MISALIGNED),
                          "descriptor region is not pointer aligned");
    }
    if ((end - start) % sizeof(Descriptor) != 0) {
        return R::failure(layoutError(LayoutFault::SIZE_NOT_MULTIPLE),
                          "descriptor region holds a partial descriptor");
    }
    if (mTerminal && mTerminal != mEnd) {
        return R::failure(layoutError(LayoutFault::TERMINAL_MISMATCH),
                          "data placed between the last descriptor and the terminal marker");
    }
    return R::success();
}

Registry::Entries Registry::entries() const {
    Result<void, LayoutError> layout = validate();
    if (!layout.ok() || !mStart) {
        DEDRV_LOG_REGISTRY("empty view: " << (layout.ok() ? "no region" : layout.message()));
        return Entries(nullptr, nullptr);
    }
    return Entries(static_cast<const Descriptor *>(mStart),
                   static_cast<const Descriptor *>(mEnd));
}

const Descriptor *Registry::at(dedrv::size index) const {
    Entries all = entries();
    if (index >= all.size()) {
        return nullptr;
    }
    return all.begin() + index;
}

} // namespace dedrv

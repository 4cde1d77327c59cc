#pragma once

#include "dedrv/compiler_control.h"
#include "dedrv/descriptor.h"
#include "dedrv/result.h"
#include "dedrv/stdint.h"
#include "dedrv/strstream.h"

/// Boundary symbols of the descriptor region, defined by the linker
/// fragments in linker/. Weak so that a binary without the fragment links
/// and sees an empty registry.
DEDRV_EXTERN_C_BEGIN
extern const char __DEDRV_MARKER_DEVICE_START[] DEDRV_WEAK;
extern const char __DEDRV_MARKER_DEVICE_END[] DEDRV_WEAK;
extern const char __DEDRV_MARKER_DEVICE_TERMINAL[] DEDRV_WEAK;
DEDRV_EXTERN_C_END

namespace dedrv {

enum class LayoutFault : u8 {
    NONE,
    MISSING_MARKER,     ///< only one of the start/end markers is defined
    END_BEFORE_START,
    MISALIGNED,         ///< start is not aligned for Descriptor
    SIZE_NOT_MULTIPLE,  ///< region size is not a multiple of sizeof(Descriptor)
    TERMINAL_MISMATCH   ///< terminal marker does not sit at the end marker
};

const char *toString(LayoutFault fault);

/// Why the descriptor region cannot be trusted, with the offending
/// addresses.
struct LayoutError {
    LayoutFault fault;
    uptr start;
    uptr end;
    uptr terminal;
};

StrStream &operator<<(StrStream &out, const LayoutError &err);

/// Read-only view of the descriptors collected into one contiguous region.
///
/// The region is untrusted until validate() succeeds: every accessor
/// yields an empty range on an invalid region.
class Registry {
  public:
    typedef const Descriptor *iterator;

    /// Iterable range over the descriptors, in link order.
    class Entries {
      public:
        Entries(iterator first, iterator last) : mBegin(first), mEnd(last) {}
        iterator begin() const { return mBegin; }
        iterator end() const { return mEnd; }
        dedrv::size size() const { return dedrv::size(mEnd - mBegin); }
        bool empty() const { return mBegin == mEnd; }

      private:
        iterator mBegin;
        iterator mEnd;
    };

    /// Empty registry.
    constexpr Registry() : mStart(nullptr), mEnd(nullptr), mTerminal(nullptr) {}

    /// Region bounded by [start, end). `terminal`, when given, must equal
    /// `end`.
    Registry(const void *start, const void *end, const void *terminal = nullptr)
        : mStart(start), mEnd(end), mTerminal(terminal) {}

    /// Region covering a descriptor array assembled by hand.
    template <dedrv::size N>
    explicit Registry(const Descriptor (&table)[N])
        : mStart(table), mEnd(table + N), mTerminal(table + N) {}

    /// The registry of the running binary, bounded by the linker markers.
    static Registry linked();

    /// Checks the region layout. Must succeed before the descriptors are
    /// used; a missing region (no markers at all) is a valid empty registry.
    DEDRV_NODISCARD Result<void, LayoutError> validate() const;
    bool valid() const { return validate().ok(); }

    Entries entries() const;
    // Each of these validates the region again; loops should take
    // entries() once.
    iterator begin() const { return entries().begin(); }
    iterator end() const { return entries().end(); }
    dedrv::size size() const { return entries().size(); }
    bool empty() const { return entries().empty(); }

    /// nullptr when out of range or invalid.
    const Descriptor *at(dedrv::size index) const;

    const void *startMarker() const { return mStart; }
    const void *endMarker() const { return mEnd; }

  private:
    LayoutError layoutError(LayoutFault fault) const;

    const void *mStart;
    const void *mEnd;
    const void *mTerminal;
};

} // namespace dedrv

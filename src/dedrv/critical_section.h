#pragma once

#include "dedrv/interrupt.h"
#include "dedrv/type_traits.h"

namespace dedrv {

// Scoped critical section. Interrupts are disabled for the lifetime of the
// object and the previous state is restored on destruction, so nested
// sections and early returns leave the interrupt flag as they found it.
//
// A reference to a live CriticalSection is the token required by
// Mutex<T>::borrow().
class CriticalSection {
  public:
    CriticalSection() : mState(saveAndDisableInterrupts()) {}
    ~CriticalSection() { restoreInterrupts(mState); }

    CriticalSection(const CriticalSection &) = delete;
    CriticalSection &operator=(const CriticalSection &) = delete;

  private:
    InterruptState mState;
};

// Runs fn(cs) inside a critical section and returns its result.
template <typename Fn>
auto with_critical_section(Fn fn) -> decltype(fn(declval<const CriticalSection &>())) {
    CriticalSection cs;
    return fn(cs);
}

} // namespace dedrv

#pragma once

#include "dedrv/critical_section.h"

namespace dedrv {

// Interrupt-safe cell. The value is only reachable through borrow(), which
// takes a live CriticalSection as proof that no interrupt handler can observe
// a torn update.
template <typename T> class Mutex {
  public:
    constexpr Mutex() : mValue() {}
    explicit constexpr Mutex(const T &value) : mValue(value) {}

    Mutex(const Mutex &) = delete;
    Mutex &operator=(const Mutex &) = delete;

    T &borrow(const CriticalSection &) { return mValue; }
    const T &borrow(const CriticalSection &) const { return mValue; }

  private:
    T mValue;
};

} // namespace dedrv

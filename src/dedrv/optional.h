#pragma once

#include "dedrv/type_traits.h"

namespace dedrv {

// nullopt support for compatibility with std::optional patterns
struct nullopt_t {};
constexpr nullopt_t nullopt{};

// Value-or-nothing holder for small, default constructible payloads
// (handles, enums). The payload is always constructed, which keeps the type
// trivially copyable when T is.
template <typename T> class Optional {
  public:
    constexpr Optional() : mValue(), mHasValue(false) {}
    constexpr Optional(nullopt_t) : mValue(), mHasValue(false) {}
    constexpr Optional(const T &value) : mValue(value), mHasValue(true) {}

    bool empty() const { return !mHasValue; }
    bool has_value() const { return mHasValue; }  // std::optional compatibility

    T *ptr() { return mHasValue ? &mValue : nullptr; }
    const T *ptr() const { return mHasValue ? &mValue : nullptr; }

    void reset() {
        mValue = T();
        mHasValue = false;
    }

    Optional &operator=(nullopt_t) {
        reset();
        return *this;
    }

    Optional &operator=(const T &value) {
        mValue = value;
        mHasValue = true;
        return *this;
    }

    bool operator!() const { return empty(); }
    explicit operator bool() const { return !empty(); }

    bool operator==(const Optional &other) const {
        if (mHasValue != other.mHasValue) {
            return false;
        }
        return !mHasValue || mValue == other.mValue;
    }
    bool operator!=(const Optional &other) const { return !(*this == other); }

    bool operator==(nullopt_t) const { return empty(); }
    bool operator!=(nullopt_t) const { return !empty(); }

    T &operator*() { return mValue; }
    const T &operator*() const { return mValue; }
    T *operator->() { return &mValue; }
    const T *operator->() const { return &mValue; }

    const T &value_or(const T &fallback) const {
        return mHasValue ? mValue : fallback;
    }

  private:
    T mValue;
    bool mHasValue;
};

template <typename T> using optional = Optional<T>;

template <typename T>
Optional<T> make_optional(const T &value) {
    return Optional<T>(value);
}

} // namespace dedrv

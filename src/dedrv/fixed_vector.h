#pragma once

#include "dedrv/stdint.h"
#include "dedrv/type_traits.h"

namespace dedrv {

// Heap-free vector of at most N plain values (descriptor pointers, report
// records). Inserts beyond the capacity leave the contents untouched and
// return false, so callers can turn an overflow into a configuration error.
template<typename T, size_t N>
class FixedVector {
    static_assert(N > 0, "FixedVector needs a non-zero capacity");
    static_assert(is_trivially_destructible<T>::value,
                  "FixedVector holds plain values only");

  public:
    typedef T* iterator;
    typedef const T* const_iterator;

    FixedVector() : mSize(0), mData() {}

    T& operator[](size_t index) { return mData[index]; }
    const T& operator[](size_t index) const { return mData[index]; }

    size_t size() const { return mSize; }
    bool empty() const { return mSize == 0; }
    bool full() const { return mSize == N; }
    constexpr size_t capacity() const { return N; }

    bool push_back(const T& value) {
        if (full()) {
            return false;
        }
        mData[mSize++] = value;
        return true;
    }

    // Inserts before position `index` (== size() appends); later elements
    // shift right by one.
    bool insert(size_t index, const T& value) {
        if (full() || index > mSize) {
            return false;
        }
        for (size_t i = mSize; i > index; --i) {
            mData[i] = mData[i - 1];
        }
        mData[index] = value;
        ++mSize;
        return true;
    }

    void pop_back() {
        if (mSize > 0) {
            --mSize;
        }
    }

    void clear() { mSize = 0; }

    // First element matching `pred`, or nullptr.
    template<typename Predicate>
    const T* find_if(Predicate pred) const {
        for (size_t i = 0; i < mSize; ++i) {
            if (pred(mData[i])) {
                return &mData[i];
            }
        }
        return nullptr;
    }

    T& back() { return mData[mSize - 1]; }
    const T& back() const { return mData[mSize - 1]; }

    iterator begin() { return mData; }
    const_iterator begin() const { return mData; }
    iterator end() { return mData + mSize; }
    const_iterator end() const { return mData + mSize; }

  private:
    size_t mSize;
    T mData[N];
};

} // namespace dedrv

#pragma once

#include "dedrv/config.h"
#include "dedrv/stdint.h"

namespace dedrv {

// Stream-style formatter backing the logging macros. Writes into an inline
// buffer so it is usable before any allocator exists and from boot code.
// Output that does not fit is truncated and flagged.
class StrStream {
  public:
    enum { kCapacity = DEDRV_STRSTREAM_CAPACITY };

    StrStream() : mLength(0), mTruncated(false) { mBuffer[0] = '\0'; }

    const char *c_str() const { return mBuffer; }
    dedrv::size size() const { return mLength; }
    bool empty() const { return mLength == 0; }
    bool truncated() const { return mTruncated; }

    void clear() {
        mLength = 0;
        mTruncated = false;
        mBuffer[0] = '\0';
    }

    StrStream &operator<<(const char *str);
    StrStream &operator<<(char c);
    StrStream &operator<<(bool b) { return (*this) << (b ? "true" : "false"); }
    StrStream &operator<<(const void *ptr);
    StrStream &operator<<(const StrStream &other) {
        return (*this) << other.c_str();
    }

    StrStream &operator<<(signed char n) { return appendSigned(n); }
    StrStream &operator<<(short n) { return appendSigned(n); }
    StrStream &operator<<(int n) { return appendSigned(n); }
    StrStream &operator<<(long n) { return appendSigned(n); }
    StrStream &operator<<(long long n) { return appendSigned(n); }
    StrStream &operator<<(unsigned char n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned short n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned int n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned long n) { return appendUnsigned(n); }
    StrStream &operator<<(unsigned long long n) { return appendUnsigned(n); }

  private:
    StrStream &appendSigned(long long n);
    StrStream &appendUnsigned(unsigned long long n);
    StrStream &appendHex(unsigned long long n);
    void append(const char *str, dedrv::size len);

    char mBuffer[kCapacity + 1];
    dedrv::size mLength;
    bool mTruncated;
};

} // namespace dedrv

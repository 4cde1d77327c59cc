#include "dedrv/strstream.h"

namespace dedrv {

void StrStream::append(const char *str, dedrv::size len) {
    for (dedrv::size i = 0; i < len; ++i) {
        if (mLength >= kCapacity) {
            mTruncated = true;
            break;
        }
        mBuffer[mLength++] = str[i];
    }
    mBuffer[mLength] = '\0';
}

StrStream &StrStream::operator<<(const char *str) {
    if (!str) {
        str = "(null)";
    }
    dedrv::size len = 0;
    while (str[len]) {
        ++len;
    }
    append(str, len);
    return *this;
}

StrStream &StrStream::operator<<(char c) {
    append(&c, 1);
    return *this;
}

StrStream &StrStream::operator<<(const void *ptr) {
    if (!ptr) {
        return (*this) << "nullptr";
    }
    return appendHex(reinterpret_cast<uptr>(ptr));
}

StrStream &StrStream::appendSigned(long long n) {
    if (n < 0) {
        append("-", 1);
        // Negate in unsigned space so LLONG_MIN does not overflow.
        return appendUnsigned(0ULL - static_cast<unsigned long long>(n));
    }
    return appendUnsigned(static_cast<unsigned long long>(n));
}

StrStream &StrStream::appendUnsigned(unsigned long long n) {
    char digits[20];
    dedrv::size count = 0;
    do {
        digits[count++] = static_cast<char>('0' + (n % 10));
        n /= 10;
    } while (n != 0);

    char out[20];
    for (dedrv::size i = 0; i < count; ++i) {
        out[i] = digits[count - 1 - i];
    }
    append(out, count);
    return *this;
}

StrStream &StrStream::appendHex(unsigned long long n) {
    static const char kHex[] = "0123456789abcdef";
    char digits[16];
    dedrv::size count = 0;
    do {
        digits[count++] = kHex[n & 0xf];
        n >>= 4;
    } while (n != 0);

    char out[18];
    out[0] = '0';
    out[1] = 'x';
    for (dedrv::size i = 0; i < count; ++i) {
        out[2 + i] = digits[count - 1 - i];
    }
    append(out, count + 2);
    return *this;
}

} // namespace dedrv

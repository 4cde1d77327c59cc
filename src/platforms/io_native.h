#pragma once

#include "dedrv/stdint.h"

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace dedrv {

namespace detail {
inline void write_stderr(const char* data, dedrv::size len) {
#ifdef _WIN32
    _write(2, data, static_cast<unsigned>(len));
#else
    ssize_t written = ::write(2, data, len);
    (void)written;
#endif
}
}  // namespace detail

// Hosted builds log to stderr, unbuffered, so a line written right before a
// crash in a hook is not lost.
inline void write_line_native(const char* line) {
    dedrv::size len = 0;
    while (line[len]) len++;
    detail::write_stderr(line, len);
    detail::write_stderr("\n", 1);
}

}  // namespace dedrv

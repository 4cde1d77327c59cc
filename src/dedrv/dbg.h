#pragma once

#include "dedrv/config.h"
#include "dedrv/strstream.h"

namespace dedrv {
void println(const char* str);

// "build/src/dedrv/lifecycle.cpp" -> "src/dedrv/lifecycle.cpp"
// "blah/blah/blah.h" -> "blah.h"
inline const char *file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') { // fallback to using last slash
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace dedrv

#if !defined(RELEASE) || defined(DEDRV_TESTING)
#define DEDRV_FORCE_DBG 1
#endif

#if !defined(DEDRV_FORCE_DBG) || !DEDRV_HAS_LOTS_OF_MEMORY
#define DEDRV_HAS_DBG 0
#define _DEDRV_DBG(X) do { if (false) { dedrv::println(""); } } while(0)  // No-op that handles << operator
#else
#define DEDRV_HAS_DBG 1
#define _DEDRV_DBG(X)                                                          \
    dedrv::println(                                                            \
        (dedrv::StrStream() << (dedrv::file_offset(__FILE__))                  \
                            << "(" << int(__LINE__) << "): " << X)             \
            .c_str())
#endif

#define DEDRV_DBG(X) _DEDRV_DBG(X)

#ifndef DEDRV_DBG_IF
#define DEDRV_DBG_IF(COND, MSG)                                                \
    do { if (COND) { DEDRV_DBG(MSG); } } while (0)
#endif

// Swallows a stream expression without evaluating it.
#define DEDRV_DBG_NO_OP(X) do { if (false) { (void)(dedrv::StrStream() << X); } } while (0)

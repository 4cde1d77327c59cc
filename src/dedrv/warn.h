#pragma once

#include "dedrv/dbg.h"

#ifndef DEDRV_WARN
#if DEDRV_HAS_LOTS_OF_MEMORY
#define DEDRV_WARN(X)                                                          \
    dedrv::println((dedrv::StrStream() << "WARN: " << X).c_str())
#define DEDRV_WARN_IF(COND, MSG) do { if (COND) { DEDRV_WARN(MSG); } } while(0)
#else
// No-op macros for memory-constrained platforms
#define DEDRV_WARN(X) do { } while(0)
#define DEDRV_WARN_IF(COND, MSG) do { if (false) { (void)(COND); } } while(0)
#endif
#endif

#pragma once

#include "dedrv/dbg.h"

#ifndef DEDRV_ERROR
#if DEDRV_HAS_LOTS_OF_MEMORY
// DEDRV_ERROR: Supports both string literals and stream-style formatting with << operator
#define DEDRV_ERROR(X) dedrv::println((dedrv::StrStream() << "ERROR: " << X).c_str())
#define DEDRV_ERROR_IF(COND, MSG) do { if (COND) { DEDRV_ERROR(MSG); } } while(0)
#else
// No-op macros for memory-constrained platforms
#define DEDRV_ERROR(X) do { } while(0)
#define DEDRV_ERROR_IF(COND, MSG) do { if (false) { (void)(COND); } } while(0)
#endif
#endif

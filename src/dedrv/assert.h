#pragma once

#include "dedrv/warn.h"

#ifndef DEBUG
#define DEDRV_ASSERT(x, MSG) DEDRV_WARN_IF(!(x), MSG)
#else

#ifndef DEDRV_USES_SYSTEM_ASSERT
#if defined(DEDRV_TESTING)
#define DEDRV_USES_SYSTEM_ASSERT 1
#else
#define DEDRV_USES_SYSTEM_ASSERT 0
#endif
#endif

#if DEDRV_USES_SYSTEM_ASSERT
#include <assert.h>
#define DEDRV_ASSERT(x, MSG)                                                   \
    do {                                                                       \
        DEDRV_WARN_IF(!(x), MSG);                                              \
        assert(x);                                                             \
    } while (0)
#else
#define DEDRV_ASSERT(x, MSG) DEDRV_WARN_IF(!(x), MSG)
#endif
#endif

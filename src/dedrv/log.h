#pragma once

#include "dedrv/dbg.h"
#include "dedrv/error.h"
#include "dedrv/warn.h"

/// @file dedrv/log.h
/// @brief Logging categories for the dedrv subsystems
///
/// Each category can be independently enabled via preprocessor defines at
/// compile-time. Disabled categories produce no code.
///
/// Example:
///   #define DEDRV_LOG_LIFECYCLE_ENABLED
///   #include "dedrv/log.h"
///
///   DEDRV_LOG_LIFECYCLE("init " << path << " priority " << priority);

/// @brief Boot and shutdown pass tracing (per device transitions)
#ifdef DEDRV_LOG_LIFECYCLE_ENABLED
    #define DEDRV_LOG_LIFECYCLE(X) DEDRV_WARN(X)
#else
    #define DEDRV_LOG_LIFECYCLE(X) DEDRV_DBG_NO_OP(X)
#endif

/// @brief Descriptor region validation and lookups
#ifdef DEDRV_LOG_REGISTRY_ENABLED
    #define DEDRV_LOG_REGISTRY(X) DEDRV_WARN(X)
#else
    #define DEDRV_LOG_REGISTRY(X) DEDRV_DBG_NO_OP(X)
#endif

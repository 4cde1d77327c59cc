#pragma once

/// @file result.h
/// @brief Result<T, E>: the return type of hooks, validation and lookups

#include "dedrv/expected.h"

namespace dedrv {

template<typename T, typename E>
using Result = expected<T, E>;

} // namespace dedrv

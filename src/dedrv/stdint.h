#pragma once

// Integer aliases used throughout dedrv. Pointer-sized aliases back the
// descriptor layout, so they must match the target's data pointer width.

#include <stddef.h>
#include <stdint.h>

namespace dedrv {

typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;
typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

typedef size_t size;
typedef uintptr_t uptr;
typedef intptr_t iptr;

static_assert(sizeof(uptr) == sizeof(void *), "uptr must be pointer sized");
static_assert(sizeof(iptr) == sizeof(void *), "iptr must be pointer sized");

} // namespace dedrv

#pragma once

#define DEDRV_CONCAT2(a, b) a##b
#define DEDRV_CONCAT(a, b) DEDRV_CONCAT2(a, b)

// Attributes used to place descriptors and to declare the linker markers.
#if defined(__GNUC__) || defined(__clang__)
  #define DEDRV_WEAK __attribute__((weak))
  // Keeps an otherwise unreferenced object alive through compilation. The
  // linker script must still KEEP() the section when --gc-sections is used.
  #define DEDRV_USED __attribute__((used))
  #define DEDRV_SECTION(name) __attribute__((section(name)))
  // An explicit alignment stops GCC from over-aligning large objects, which
  // would pad objects collected into one section.
  #define DEDRV_ALIGNED(n) __attribute__((aligned(n)))
#else
  #error "dedrv needs section and weak symbol support (GCC or Clang)"
#endif

#ifdef __cplusplus
  #define DEDRV_EXTERN_C_BEGIN extern "C" {
  #define DEDRV_EXTERN_C_END   }
  #define DEDRV_EXTERN_C       extern "C"
#else
  #define DEDRV_EXTERN_C_BEGIN
  #define DEDRV_EXTERN_C_END
  #define DEDRV_EXTERN_C
#endif

// Boot and shutdown reports carry the per-device failures; dropping one
// silently loses them.
//
// Usage: DEDRV_NODISCARD Report init();
#if __cplusplus >= 201703L
  #define DEDRV_NODISCARD [[nodiscard]]
#else
  #define DEDRV_NODISCARD __attribute__((warn_unused_result))
#endif

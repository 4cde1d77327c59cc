#pragma once

#include "dedrv/compiler_control.h"
#include "dedrv/stdint.h"

// Bare metal targets without Arduino have no console. A board support package
// routes log output (UART, RTT, semihosting) by defining this function.
DEDRV_EXTERN_C void dedrv_console_write(const char* str, dedrv::size len) DEDRV_WEAK;

namespace dedrv {

inline void write_line_null(const char* line) {
    if (!dedrv_console_write) return;

    size len = 0;
    while (line[len]) len++;
    dedrv_console_write(line, len);
    dedrv_console_write("\n", 1);
}

}  // namespace dedrv

#pragma once

namespace dedrv {

// Writes one log line to the platform console (stderr on hosts, Serial on
// Arduino, dedrv_console_write() on bare metal). No printf dependency.
void println(const char* str);

#ifdef DEDRV_TESTING

// Receives every line passed to println() while installed.
typedef void (*println_handler_t)(const char* line);

void inject_println_handler(println_handler_t handler);

// Restores the platform output.
void clear_println_handler();

#endif // DEDRV_TESTING

} // namespace dedrv

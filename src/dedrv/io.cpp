#include "dedrv/io.h"

#if defined(DEDRV_TESTING) || defined(__linux__) || defined(__APPLE__) || defined(_WIN32)
#include "platforms/io_native.h"
#define DEDRV_WRITE_LINE write_line_native
#elif defined(ARDUINO)
#include <Arduino.h>
#include "platforms/io_arduino.h"
#define DEDRV_WRITE_LINE write_line_arduino
#else
#include "platforms/io_null.h"
#define DEDRV_WRITE_LINE write_line_null
#endif

namespace dedrv {

#ifdef DEDRV_TESTING
namespace {
println_handler_t& get_println_handler() {
    static println_handler_t handler = nullptr;
    return handler;
}
} // namespace

void inject_println_handler(println_handler_t handler) {
    get_println_handler() = handler;
}

void clear_println_handler() {
    get_println_handler() = nullptr;
}
#endif // DEDRV_TESTING

void println(const char* str) {
    if (!str) return;

#ifdef DEDRV_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif

    DEDRV_WRITE_LINE(str);
}

} // namespace dedrv

#pragma once

namespace dedrv {

// Lines go to the primary serial port once the sketch has opened it; before
// Serial.begin() they are dropped.
inline void write_line_arduino(const char* line) {
    if (Serial) {
        Serial.println(line);
    }
}

}  // namespace dedrv

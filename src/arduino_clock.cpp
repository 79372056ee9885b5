#include "arduino_clock.h"

uint32_t ArduinoClock::nowMs() {
    return millis();
}

void ArduinoClock::sleepMs(uint32_t ms) {
    delay(ms);
}

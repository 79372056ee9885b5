#pragma once
#include <Arduino.h>
#include "clock.h"

// millis()/delay() time source for the discovery core
class ArduinoClock : public Clock {
public:
    uint32_t nowMs() override;
    void     sleepMs(uint32_t ms) override;
};

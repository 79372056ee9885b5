#pragma once
#include <Arduino.h>

enum class ButtonEvent {
    NONE,
    MODE_PRESS,     // BTN1 short: cycle RECEIVE / MERCHANT / SEND
    MODE_HOLD,      // BTN1 2-second hold: server-side listing
    SELECT_PRESS,   // BTN2 short: next nearby user
    SELECT_HOLD,    // BTN2 2-second hold: restart discovery
    DIAG_HOLD       // both held 10 seconds: diagnostics
};

const char *buttonEventName(ButtonEvent ev);

namespace Buttons {
    void begin();
    ButtonEvent poll();   // call every loop tick, returns event if one fired
}

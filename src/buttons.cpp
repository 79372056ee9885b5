#include "buttons.h"
#include "config.h"

struct BtnState {
    bool     down       = false;
    uint32_t pressedAt  = 0;
    bool     holdFired  = false;
    bool     suppressed = false;   // consumed by the combined hold
};

static BtnState s_btn1, s_btn2;
static uint32_t s_bothPressedAt = 0;
static bool     s_bothHoldFired = false;

const char *buttonEventName(ButtonEvent ev) {
    switch (ev) {
        case ButtonEvent::NONE:         return "NONE";
        case ButtonEvent::MODE_PRESS:   return "MODE_PRESS";
        case ButtonEvent::MODE_HOLD:    return "MODE_HOLD";
        case ButtonEvent::SELECT_PRESS: return "SELECT_PRESS";
        case ButtonEvent::SELECT_HOLD:  return "SELECT_HOLD";
        case ButtonEvent::DIAG_HOLD:    return "DIAG_HOLD";
    }
    return "?";
}

// Short fires on release, hold fires once the threshold is reached while down
static ButtonEvent track(BtnState &b, bool raw, uint32_t now,
                         ButtonEvent shortEv, ButtonEvent holdEv) {
    if (raw && !b.down) {
        b.down      = true;
        b.pressedAt = now;
        b.holdFired = false;
        return ButtonEvent::NONE;
    }
    if (!raw && b.down) {
        b.down = false;
        bool skip = b.holdFired || b.suppressed;
        b.suppressed = false;
        if (!skip && now - b.pressedAt >= BTN_DEBOUNCE_MS) return shortEv;
        return ButtonEvent::NONE;
    }
    if (raw && !b.holdFired && !b.suppressed && now - b.pressedAt >= BTN_HOLD_SHORT_MS) {
        b.holdFired = true;
        return holdEv;
    }
    return ButtonEvent::NONE;
}

namespace Buttons {

void begin() {
    pinMode(PIN_BTN1, INPUT_PULLUP);
    pinMode(PIN_BTN2, INPUT_PULLUP);
}

ButtonEvent poll() {
    uint32_t now = millis();

    // Active-low with pull-up
    bool raw1 = (digitalRead(PIN_BTN1) == LOW);
    bool raw2 = (digitalRead(PIN_BTN2) == LOW);

    // Both-button combined hold swallows the single-button events
    if (raw1 && raw2) {
        s_btn1.suppressed = true;
        s_btn2.suppressed = true;
        if (s_bothPressedAt == 0) {
            s_bothPressedAt = now;
            s_bothHoldFired = false;
        } else if (!s_bothHoldFired && (now - s_bothPressedAt >= BTN_HOLD_DIAG_MS)) {
            s_bothHoldFired = true;
            return ButtonEvent::DIAG_HOLD;
        }
    } else {
        s_bothPressedAt = 0;
    }

    ButtonEvent ev = track(s_btn1, raw1, now, ButtonEvent::MODE_PRESS, ButtonEvent::MODE_HOLD);
    if (ev != ButtonEvent::NONE) return ev;
    return track(s_btn2, raw2, now, ButtonEvent::SELECT_PRESS, ButtonEvent::SELECT_HOLD);
}

} // namespace Buttons

#pragma once
#include <stdint.h>

// Monotonic millisecond time source. On target this is millis()/delay().
class Clock {
public:
    virtual ~Clock() {}

    // Wraps at ~49 days; compare with unsigned subtraction
    virtual uint32_t nowMs() = 0;
    virtual void     sleepMs(uint32_t ms) = 0;
};

// True once `now` has reached `deadline`, across millis() wrap
inline bool deadlineReached(uint32_t now, uint32_t deadline) {
    return (int32_t)(now - deadline) >= 0;
}

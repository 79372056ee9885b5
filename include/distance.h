#pragma once
#include <stdint.h>

// Log-distance path-loss model
struct PathLossModel {
    float rssiAt1m;   // calibrated RSSI at one metre (negative dBm)
    float exponent;   // path-loss exponent
};

enum class Proximity : uint8_t {
    VERY_CLOSE,
    NEARBY,
    IN_RANGE,
    FURTHER,
    EDGE_OF_RANGE
};

namespace Distance {
    // Replace the calibration constants (loaded from NVS at boot)
    void configure(const PathLossModel &model);
    PathLossModel model();

    // Metres, rounded to one decimal. Non-negative RSSI yields 0.
    float estimate(int rssi);

    // Display only, never used for matching
    Proximity bucket(float meters);
    const char *label(Proximity p);
}

#include "distance.h"
#include "config.h"
#include <math.h>
#include <mutex>

static PathLossModel s_model = {DISTANCE_RSSI_AT_1M, DISTANCE_PATH_LOSS_EXP};
// Written from the main loop, read on the resolver task
static std::mutex    s_modelLock;

namespace Distance {

void configure(const PathLossModel &model) {
    // Exponent below free space would invert the model's assumptions
    if (model.exponent < 2.0f || model.rssiAt1m >= 0.0f) return;
    std::lock_guard<std::mutex> guard(s_modelLock);
    s_model = model;
}

PathLossModel model() {
    std::lock_guard<std::mutex> guard(s_modelLock);
    return s_model;
}

float estimate(int rssi) {
    if (rssi >= 0) return 0.0f;

    PathLossModel m = model();
    float ratio = (m.rssiAt1m - (float)rssi) / (10.0f * m.exponent);
    float meters = powf(10.0f, ratio);

    return roundf(meters * 10.0f) / 10.0f;
}

Proximity bucket(float meters) {
    if (meters <= 0.5f) return Proximity::VERY_CLOSE;
    if (meters <= 1.5f) return Proximity::NEARBY;
    if (meters <= 3.0f) return Proximity::IN_RANGE;
    if (meters <= 5.0f) return Proximity::FURTHER;
    return Proximity::EDGE_OF_RANGE;
}

const char *label(Proximity p) {
    switch (p) {
        case Proximity::VERY_CLOSE:    return "Very close";
        case Proximity::NEARBY:        return "Nearby";
        case Proximity::IN_RANGE:      return "In range";
        case Proximity::FURTHER:       return "Further away";
        case Proximity::EDGE_OF_RANGE: return "Edge of range";
    }
    return "";
}

} // namespace Distance

#include "datapoints.h"
#include <cstdlib>
#include <cerrno>

namespace cozyhub {

static const DatapointRange RANGES[] = {
    {DP_POWER,      "power",       0, 255},
    {DP_MODE,       "mode",        0, 1},
    {DP_COLOR_TEMP, "color_temp",  0, 1000},
    {DP_BRIGHTNESS, "brightness",  0, 1000},
    {DP_HUE,        "hue",         0, 360},
    {DP_SATURATION, "saturation",  0, 1000},
};

static const int NUM_RANGES = sizeof(RANGES) / sizeof(RANGES[0]);

// Wire keys are small integers; anything above this is not a datapoint
static const long MAX_DATAPOINT_ID = 255;

const DatapointRange* findDatapointRange(int id) {
    for (int i = 0; i < NUM_RANGES; i++) {
        if (RANGES[i].id == id) {
            return &RANGES[i];
        }
    }
    return nullptr;
}

bool isValidDatapointValue(int id, int32_t value) {
    const DatapointRange* range = findDatapointRange(id);
    if (range == nullptr) return true;
    return value >= range->minValue && value <= range->maxValue;
}

bool validateDatapoints(const DatapointMap& payload, int& badId) {
    badId = 0;
    if (payload.empty()) return false;

    for (DatapointMap::const_iterator it = payload.begin(); it != payload.end(); ++it) {
        if (it->first <= 0 || it->first > MAX_DATAPOINT_ID ||
            !isValidDatapointValue(it->first, it->second)) {
            badId = it->first;
            return false;
        }
    }
    return true;
}

bool parseDatapointKey(const char* key, int& id) {
    if (key == nullptr || key[0] == '\0') return false;

    for (const char* p = key; *p != '\0'; p++) {
        if (*p < '0' || *p > '9') return false;
    }

    errno = 0;
    long value = strtol(key, nullptr, 10);
    if (errno != 0 || value > MAX_DATAPOINT_ID) return false;

    id = (int)value;
    return true;
}

void buildPowerPayload(bool on, DatapointMap& out) {
    out.clear();
    if (on) {
        out[DP_POWER] = POWER_ON;
        out[DP_MODE] = 0;
    } else {
        out[DP_POWER] = POWER_OFF;
    }
}

} // namespace cozyhub

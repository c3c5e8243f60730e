#pragma once
#include <cstdint>
#include <map>

namespace cozyhub {

// Datapoint ids fixed by the device family
static const int DP_POWER      = 1;  // 0 off, 255 on
static const int DP_MODE       = 2;  // 0 normal, 1 effects
static const int DP_COLOR_TEMP = 3;  // 0-1000
static const int DP_BRIGHTNESS = 4;  // 0-1000
static const int DP_HUE        = 5;  // 0-360
static const int DP_SATURATION = 6;  // saturation x10, 0-1000

static const int32_t POWER_OFF = 0;
static const int32_t POWER_ON  = 255;

// Datapoint id -> value, ordered by id
typedef std::map<int, int32_t> DatapointMap;

struct DatapointRange {
    int id;
    const char* name;
    int32_t minValue;
    int32_t maxValue;
};

// Range for a known datapoint, nullptr for ids outside the family schema
const DatapointRange* findDatapointRange(int id);

// Known ids must be within range; unknown ids are accepted as-is
bool isValidDatapointValue(int id, int32_t value);

// Validate every entry of a control payload. Empty payloads are invalid.
// badId receives the first offending id (0 for an empty payload).
bool validateDatapoints(const DatapointMap& payload, int& badId);

// Parse a datapoint key as sent on the wire ("4" -> 4).
// Rejects empty, signed, non-decimal and out-of-range keys.
bool parseDatapointKey(const char* key, int& id);

// Power payload as the light platform sends it: on also resets mode to normal
void buildPowerPayload(bool on, DatapointMap& out);

} // namespace cozyhub

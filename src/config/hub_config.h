#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>
#include "../devices/device_session.h"
#include "../discovery/discovery.h"

namespace cozyhub {

struct HubConfig {
    std::vector<std::string> staticAddresses;  // "ip"
    DiscoveryConfig discovery;                 // "subnets", "discovery", "subnet_scan"
    SessionConfig session;                     // "session"
    int scanIntervalS;                         // "scan_interval"
    int statusIntervalS;                       // "status_interval"
    std::string catalogPath;                   // "catalog", empty for none
};

HubConfig defaultHubConfig();

// Scan intervals below SCAN_INTERVAL_MIN_S are raised to it
int clampScanInterval(int seconds);

// Split "a, b c" on commas and whitespace. Empty items are skipped.
// Returns the number of items appended.
int splitAddressList(const char* text, std::vector<std::string>& out);

// Fill config from a JSON object. Missing keys keep their current value.
// Returns false on malformed JSON or a non-object root.
bool parseHubConfig(const char* json, HubConfig& config);

bool loadHubConfigFile(const char* path, HubConfig& config);

} // namespace cozyhub

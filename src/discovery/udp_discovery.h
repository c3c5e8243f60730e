#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../clock.h"

namespace cozyhub {

// Broadcast probe tuning. Defaults are what the devices are known to answer;
// keep them unless a network needs otherwise.
struct BroadcastConfig {
    std::string broadcastAddress;
    uint16_t port;
    int sendCount;                    // probe datagrams sent
    unsigned long sendGapMs;          // pause after each datagram
    int firstReplyAttempts;           // short waits for the first reply
    unsigned long receiveTimeoutMs;   // per wait, both phases
    int maxReplies;                   // distinct addresses collected at most
};

BroadcastConfig defaultBroadcastConfig();

// Append address unless already present. Returns true if it was added.
bool addUniqueAddress(std::vector<std::string>& list, const std::string& address);

// INFO-shaped probe datagram {"cmd":0,"pv":0,"sn":..,"msg":{}} (no CRLF)
bool buildDiscoveryProbe(const std::string& sn, std::string& out);

// Broadcast the probe and collect the distinct source addresses of the
// replies. An empty list means no device answered; it is not an error.
std::vector<std::string> discoverByBroadcast(const BroadcastConfig& config,
                                             const CancelFlag* cancel = nullptr);

} // namespace cozyhub

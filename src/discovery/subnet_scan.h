#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../clock.h"

namespace cozyhub {

struct SubnetScanConfig {
    uint16_t port;
    unsigned long timeoutMs;  // per probe
    int batchSize;            // connects in flight at once
    uint32_t maxHosts;        // larger ranges are refused
};

SubnetScanConfig defaultSubnetScanConfig();

// Parse "a.b.c.d/n"; a bare address is a /32. Host bits are masked off,
// so "192.168.1.77/24" yields network 192.168.1.0. network is host order.
bool parseCidr(const char* cidr, uint32_t& network, int& prefix);

std::string formatIpv4(uint32_t address);

// Usable host addresses of a range, in ascending order: network and
// broadcast addresses excluded, except /31 (both) and /32 (the address).
// Fails on malformed input or when the range exceeds maxHosts.
bool enumerateHosts(const char* cidr, std::vector<std::string>& hosts, uint32_t maxHosts);

// Connects to keep in flight: requested (all hosts if <= 0), capped by the
// open-file limit less SUBNET_PROBE_FD_RESERVE. Never less than 1.
size_t probeBatchLimit(int requested, size_t hostCount);

// Concurrent TCP connect to every host; returns those that accepted, in input
// order. Each connection is closed immediately. Refused, timed out and
// failed attempts are simply not found.
std::vector<std::string> probeHosts(const std::vector<std::string>& hosts, uint16_t port,
                                    unsigned long timeoutMs, int batchSize,
                                    const CancelFlag* cancel = nullptr);

// enumerateHosts + probeHosts. A malformed range logs and yields no hosts.
std::vector<std::string> scanSubnet(const char* cidr, const SubnetScanConfig& config,
                                    const CancelFlag* cancel = nullptr);

} // namespace cozyhub

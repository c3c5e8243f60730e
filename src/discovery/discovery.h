#pragma once
#include <set>
#include <string>
#include <vector>
#include "subnet_scan.h"
#include "udp_discovery.h"
#include "../clock.h"

namespace cozyhub {

typedef std::set<std::string> AddressSet;

// Source of candidate device addresses for one reconciliation tick
class AddressSource {
public:
    virtual ~AddressSource() {}
    virtual AddressSet discover(const CancelFlag* cancel) = 0;
};

struct DiscoveryConfig {
    bool broadcastEnabled;
    BroadcastConfig broadcast;
    SubnetScanConfig subnetScan;
    std::vector<std::string> subnets;  // CIDR ranges probed on every run
};

DiscoveryConfig defaultDiscoveryConfig();

// Broadcast probe plus one subnet probe per configured range
class NetworkDiscovery : public AddressSource {
public:
    explicit NetworkDiscovery(const DiscoveryConfig& config);

    AddressSet discover(const CancelFlag* cancel) override;

    int runs() const { return _runs; }

private:
    DiscoveryConfig _config;
    int _runs;
};

} // namespace cozyhub

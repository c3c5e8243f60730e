#include "discovery.h"
#include "../debug_log.h"

namespace cozyhub {

DiscoveryConfig defaultDiscoveryConfig() {
    DiscoveryConfig config;
    config.broadcastEnabled = true;
    config.broadcast = defaultBroadcastConfig();
    config.subnetScan = defaultSubnetScanConfig();
    return config;
}

NetworkDiscovery::NetworkDiscovery(const DiscoveryConfig& config)
    : _config(config), _runs(0) {}

AddressSet NetworkDiscovery::discover(const CancelFlag* cancel) {
    AddressSet found;
    _runs++;

    if (_config.broadcastEnabled) {
        std::vector<std::string> replies = discoverByBroadcast(_config.broadcast, cancel);
        found.insert(replies.begin(), replies.end());
    }

    for (size_t i = 0; i < _config.subnets.size(); i++) {
        if (isCancelled(cancel)) break;
        // A malformed range logs inside scanSubnet and yields nothing
        std::vector<std::string> hosts = scanSubnet(_config.subnets[i].c_str(),
                                                    _config.subnetScan, cancel);
        found.insert(hosts.begin(), hosts.end());
    }

    LOG_DEBUG("SCAN", "Discovery run #%d found %zu address(es)", _runs, found.size());
    return found;
}

} // namespace cozyhub

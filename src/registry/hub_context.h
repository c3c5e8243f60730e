#pragma once
#include "device_registry.h"
#include "../config/hub_config.h"
#include "../devices/catalog.h"

namespace cozyhub {

// Everything the reconciler and the status reporter share. Built once in
// main and passed by reference; the registry is its only mutable part.
struct HubContext {
    HubConfig config;
    const Catalog* catalog;
    DeviceRegistry registry;

    HubContext(const HubConfig& cfg, const Catalog* cat) : config(cfg), catalog(cat) {}

    HubContext(const HubContext&) = delete;
    HubContext& operator=(const HubContext&) = delete;
};

} // namespace cozyhub

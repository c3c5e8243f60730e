#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include "config.h"
#include "debug_log.h"
#include "clock.h"
#include "config/hub_config.h"
#include "devices/catalog.h"
#include "discovery/discovery.h"
#include "registry/hub_context.h"
#include "registry/reconciler.h"

static volatile sig_atomic_t stopRequested = 0;
static cozyhub::Reconciler* volatile activeReconciler = nullptr;

static void onSignal(int) {
    stopRequested = 1;
    cozyhub::Reconciler* reconciler = activeReconciler;
    if (reconciler != nullptr) {
        reconciler->requestStop();
    }
}

static bool installSignalHandlers() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        return false;
    }
    signal(SIGPIPE, SIG_IGN);
    return true;
}

// "1:255 4:500"
static std::string formatDatapoints(const cozyhub::DatapointMap& values) {
    std::string out;
    char item[32];
    for (cozyhub::DatapointMap::const_iterator it = values.begin(); it != values.end(); ++it) {
        snprintf(item, sizeof(item), "%s%d:%ld", out.empty() ? "" : " ",
                 it->first, (long)it->second);
        out += item;
    }
    return out;
}

// One line per registered device, with its current datapoints
static void reportStatus(cozyhub::HubContext& context) {
    std::vector<cozyhub::SessionPtr> sessions = context.registry.all();
    LOG_INFO("MAIN", "%zu device(s) registered", sessions.size());

    for (size_t i = 0; i < sessions.size() && !stopRequested; i++) {
        cozyhub::DatapointMap values;
        cozyhub::SessionError err = cozyhub::SessionError::NOT_CONNECTED;
        if (sessions[i]->isAvailable()) {
            err = sessions[i]->query(values);
        }

        cozyhub::Device device = sessions[i]->device();
        LOG_INFO("MAIN", "  %s %s (%s) at %s: %s %s",
                 device.id.c_str(),
                 device.modelName.empty() ? device.productId.c_str() : device.modelName.c_str(),
                 device.typeCode.empty() ? "?" : device.typeCode.c_str(),
                 sessions[i]->targetHost().c_str(),
                 device.available ? "available" : "unavailable",
                 err == cozyhub::SessionError::NONE ? formatDatapoints(values).c_str()
                                                    : cozyhub::sessionErrorToString(err));
    }
}

int main(int argc, char** argv) {
    printf("\n");
    printf("============================\n");
    printf("  CozyHub v" HUB_VERSION "\n");
    printf("============================\n");
    printf("\n");
    fflush(stdout);

    // 1. Configuration
    cozyhub::HubConfig config = cozyhub::defaultHubConfig();
    if (argc > 1) {
        if (!cozyhub::loadHubConfigFile(argv[1], config)) {
            LOG_ERROR("MAIN", "Cannot load config %s", argv[1]);
            return 1;
        }
    } else {
        LOG_INFO("MAIN", "No config file given, using defaults");
    }

    // 2. Product catalog
    cozyhub::JsonCatalog catalog;
    if (!config.catalogPath.empty()) {
        if (!catalog.loadFile(config.catalogPath.c_str())) {
            LOG_ERROR("MAIN", "Cannot load catalog %s", config.catalogPath.c_str());
            return 1;
        }
    } else {
        LOG_INFO("MAIN", "No catalog configured, devices will have no capabilities");
    }

    if (!installSignalHandlers()) {
        LOG_ERROR("MAIN", "Cannot install signal handlers: %s", strerror(errno));
        return 1;
    }

    // 3. Initial discovery, then periodic reconciliation
    cozyhub::HubContext context(config, &catalog);
    cozyhub::NetworkDiscovery discovery(config.discovery);
    cozyhub::Reconciler reconciler(context, discovery);

    activeReconciler = &reconciler;
    reconciler.runInitial();
    if (stopRequested) {
        LOG_INFO("MAIN", "Interrupted during initial discovery");
        activeReconciler = nullptr;
        reconciler.stop();
        return 0;
    }
    if (!reconciler.start()) {
        activeReconciler = nullptr;
        reconciler.stop();
        return 1;
    }
    LOG_INFO("MAIN", "Startup complete, %d device(s) registered", context.registry.count());

    // 4. Status report every status_interval until SIGINT/SIGTERM
    unsigned long statusIntervalMs = (unsigned long)config.statusIntervalS * 1000UL;
    unsigned long lastStatusMs = cozyhub::millis();
    while (!stopRequested) {
        unsigned long now = cozyhub::millis();
        if (now - lastStatusMs >= statusIntervalMs) {
            lastStatusMs = now;
            reportStatus(context);
        }
        cozyhub::delayMs(200);
    }

    LOG_INFO("MAIN", "Shutting down");
    activeReconciler = nullptr;
    reconciler.stop();

    cozyhub::ReconcileStats stats = reconciler.stats();
    LOG_INFO("MAIN", "%d tick(s), %d added, %d removed, %d/%d reconnects",
             stats.ticks, stats.devicesAdded, stats.devicesRemoved,
             stats.reconnectSuccesses, stats.reconnectAttempts);
    return 0;
}

#include "hub_config.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include "../config.h"
#include "../debug_log.h"

namespace cozyhub {

HubConfig defaultHubConfig() {
    HubConfig config;
    config.discovery = defaultDiscoveryConfig();
    config.session = defaultSessionConfig();
    config.scanIntervalS = SCAN_INTERVAL_S;
    config.statusIntervalS = STATUS_INTERVAL_S;
    return config;
}

int clampScanInterval(int seconds) {
    if (seconds < SCAN_INTERVAL_MIN_S) {
        LOG_INFO("CONFIG", "scan_interval %d s raised to minimum %d s",
                 seconds, SCAN_INTERVAL_MIN_S);
        return SCAN_INTERVAL_MIN_S;
    }
    return seconds;
}

int splitAddressList(const char* text, std::vector<std::string>& out) {
    if (text == nullptr) return 0;

    int added = 0;
    std::string item;
    for (const char* p = text; ; p++) {
        char c = *p;
        if (c == '\0' || c == ',' || isspace((unsigned char)c)) {
            if (!item.empty()) {
                out.push_back(item);
                item.clear();
                added++;
            }
            if (c == '\0') break;
        } else {
            item += c;
        }
    }
    return added;
}

// "key": [..] or "key": "a, b c"
static void readAddressList(JsonVariantConst value, std::vector<std::string>& out) {
    if (value.isNull()) return;

    out.clear();
    if (value.is<const char*>()) {
        splitAddressList(value.as<const char*>(), out);
        return;
    }
    JsonArrayConst list = value.as<JsonArrayConst>();
    for (JsonVariantConst item : list) {
        const char* text = item.as<const char*>();
        if (text != nullptr) {
            splitAddressList(text, out);
        }
    }
}

static void readDiscovery(JsonObjectConst obj, DiscoveryConfig& discovery) {
    if (obj.isNull()) return;

    BroadcastConfig& b = discovery.broadcast;
    discovery.broadcastEnabled = obj["enabled"] | discovery.broadcastEnabled;
    if (obj["broadcast_address"].is<const char*>()) {
        b.broadcastAddress = obj["broadcast_address"].as<const char*>();
    }
    b.port = obj["port"] | b.port;
    b.sendCount = obj["send_count"] | b.sendCount;
    b.sendGapMs = obj["send_gap_ms"] | b.sendGapMs;
    b.firstReplyAttempts = obj["first_reply_attempts"] | b.firstReplyAttempts;
    b.receiveTimeoutMs = obj["receive_timeout_ms"] | b.receiveTimeoutMs;
    b.maxReplies = obj["max_replies"] | b.maxReplies;
}

static void readSubnetScan(JsonObjectConst obj, SubnetScanConfig& scan) {
    if (obj.isNull()) return;

    scan.port = obj["port"] | scan.port;
    scan.timeoutMs = obj["timeout_ms"] | scan.timeoutMs;
    scan.batchSize = obj["batch_size"] | scan.batchSize;
    scan.maxHosts = obj["max_hosts"] | scan.maxHosts;
}

static void readSession(JsonObjectConst obj, SessionConfig& session) {
    if (obj.isNull()) return;

    session.port = obj["port"] | session.port;
    session.connectTimeoutMs = obj["connect_timeout_ms"] | session.connectTimeoutMs;
    session.responseTimeoutMs = obj["response_timeout_ms"] | session.responseTimeoutMs;
    session.queryAttempts = obj["query_attempts"] | session.queryAttempts;
}

bool parseHubConfig(const char* json, HubConfig& config) {
    if (json == nullptr) return false;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        LOG_ERROR("CONFIG", "Failed to parse config JSON: %s", err.c_str());
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull()) {
        LOG_ERROR("CONFIG", "Config root must be a JSON object");
        return false;
    }

    readAddressList(root["ip"], config.staticAddresses);
    readAddressList(root["subnets"], config.discovery.subnets);

    if (root["scan_interval"].is<int>()) {
        config.scanIntervalS = clampScanInterval(root["scan_interval"].as<int>());
    }
    if (root["status_interval"].is<int>()) {
        int status = root["status_interval"].as<int>();
        config.statusIntervalS = status > 0 ? status : STATUS_INTERVAL_S;
    }
    if (root["catalog"].is<const char*>()) {
        config.catalogPath = root["catalog"].as<const char*>();
    }

    readDiscovery(root["discovery"].as<JsonObjectConst>(), config.discovery);
    readSubnetScan(root["subnet_scan"].as<JsonObjectConst>(), config.discovery.subnetScan);
    readSession(root["session"].as<JsonObjectConst>(), config.session);

    LOG_INFO("CONFIG", "%zu static address(es), %zu subnet(s), scan every %d s",
             config.staticAddresses.size(), config.discovery.subnets.size(),
             config.scanIntervalS);
    return true;
}

bool loadHubConfigFile(const char* path, HubConfig& config) {
    if (path == nullptr) return false;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("CONFIG", "Cannot open config file %s", path);
        return false;
    }

    std::stringstream content;
    content << in.rdbuf();
    return parseHubConfig(content.str().c_str(), config);
}

} // namespace cozyhub

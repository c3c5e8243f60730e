#include "envelope.h"
#include <cstring>
#include "../clock.h"
#include "../debug_log.h"

namespace cozyhub {

static const char* UNKNOWN_VERSION = "Unknown";

bool isValidCommand(int cmd) {
    return cmd == (int)Command::INFO ||
           cmd == (int)Command::QUERY ||
           cmd == (int)Command::SET;
}

const char* commandToString(int cmd) {
    switch (cmd) {
        case (int)Command::INFO:  return "INFO";
        case (int)Command::QUERY: return "QUERY";
        case (int)Command::SET:   return "SET";
        default:                  return "UNKNOWN";
    }
}

std::string SequenceGenerator::next() {
    uint64_t now = epochMillis();
    if (now <= _last) {
        now = _last + 1;
    }
    _last = now;
    return std::to_string((unsigned long long)now);
}

bool buildRequest(JsonDocument& doc, int cmd, const std::string& sn,
                  const DatapointMap& payload) {
    if (!isValidCommand(cmd)) {
        return false;
    }

    doc.clear();
    doc["cmd"] = cmd;
    doc["pv"] = PROTOCOL_VERSION;
    doc["sn"] = sn;

    JsonObject msg = doc["msg"].to<JsonObject>();

    if (cmd == (int)Command::QUERY) {
        JsonArray attr = msg["attr"].to<JsonArray>();
        attr.add(0);
    } else if (cmd == (int)Command::SET) {
        JsonArray attr = msg["attr"].to<JsonArray>();
        JsonObject data = msg["data"].to<JsonObject>();
        for (DatapointMap::const_iterator it = payload.begin(); it != payload.end(); ++it) {
            attr.add(it->first);
            data[std::to_string(it->first)] = it->second;
        }
    }

    return true;
}

bool encodeRequest(int cmd, const std::string& sn, const DatapointMap& payload,
                   std::string& out) {
    JsonDocument doc;
    if (!buildRequest(doc, cmd, sn, payload)) {
        LOG_ERROR("CODEC", "Invalid command kind: %d", cmd);
        return false;
    }

    out.clear();
    serializeJson(doc, out);
    out += FRAME_DELIMITER;
    return true;
}

bool decodeFrame(const char* data, size_t len, JsonDocument& doc) {
    if (data == nullptr) return false;

    while (len > 0 && (data[len - 1] == '\n' || data[len - 1] == '\r')) {
        len--;
    }
    if (len == 0) return false;

    DeserializationError err = deserializeJson(doc, data, len);
    if (err) {
        LOG_DEBUG("CODEC", "Failed to parse frame: %s", err.c_str());
        return false;
    }

    return doc.is<JsonObject>();
}

bool responseMatches(const JsonDocument& response, const std::string& sn) {
    const char* got = response["sn"];
    if (got == nullptr) return false;
    return sn == got;
}

static void copyString(JsonObjectConst msg, const char* key, std::string& out,
                       const char* fallback) {
    const char* value = msg[key];
    out = value != nullptr ? value : fallback;
}

bool parseInfoReply(JsonObjectConst msg, InfoReply& info) {
    if (msg.isNull()) return false;

    copyString(msg, "did", info.did, "");
    copyString(msg, "dtp", info.dtp, "");
    copyString(msg, "pid", info.pid, "");
    copyString(msg, "mac", info.mac, "");
    copyString(msg, "ip", info.ip, "");
    copyString(msg, "sv", info.sv, UNKNOWN_VERSION);
    copyString(msg, "hv", info.hv, "");

    info.hasRssi = msg["rssi"].is<int>();
    info.rssi = info.hasRssi ? msg["rssi"].as<int>() : 0;

    return !info.did.empty() && !info.pid.empty();
}

bool parseQueryData(JsonObjectConst msg, DatapointMap& out, int& dropped) {
    out.clear();
    dropped = 0;

    if (msg.isNull()) return false;

    JsonObjectConst data = msg["data"];
    if (data.isNull()) return false;

    for (JsonPairConst kv : data) {
        int id = 0;
        if (!parseDatapointKey(kv.key().c_str(), id)) {
            LOG_DEBUG("CODEC", "Skipping datapoint key '%s'", kv.key().c_str());
            dropped++;
            continue;
        }
        if (!kv.value().is<int32_t>()) {
            LOG_DEBUG("CODEC", "Skipping datapoint %d: not an integer", id);
            dropped++;
            continue;
        }
        int32_t value = kv.value().as<int32_t>();
        if (!isValidDatapointValue(id, value)) {
            LOG_DEBUG("CODEC", "Skipping datapoint %d: %ld out of range", id, (long)value);
            dropped++;
            continue;
        }
        out[id] = value;
    }

    return true;
}

} // namespace cozyhub

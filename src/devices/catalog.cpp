#include "catalog.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include "../debug_log.h"

namespace cozyhub {

int parseCatalogEntry(JsonObjectConst entry, std::map<std::string, ModelInfo>& models) {
    if (entry.isNull()) return 0;

    const char* typeCode = entry["c"];
    JsonArrayConst list = entry["m"];
    if (list.isNull()) return 0;

    int added = 0;
    for (JsonObjectConst model : list) {
        const char* pid = model["pid"];
        if (pid == nullptr || pid[0] == '\0') {
            continue;
        }

        ModelInfo info;
        info.typeCode = typeCode != nullptr ? typeCode : "";
        info.modelName = model["n"] | "";
        info.icon = model["i"] | "";

        JsonArrayConst dpids = model["dpid"];
        for (JsonVariantConst dp : dpids) {
            if (!dp.is<int>()) continue;
            int id = dp.as<int>();
            if (std::find(info.datapointIds.begin(), info.datapointIds.end(), id) ==
                info.datapointIds.end()) {
                info.datapointIds.push_back(id);
            }
        }

        models[pid] = info;
        added++;
    }
    return added;
}

bool JsonCatalog::load(const char* json) {
    if (json == nullptr) return false;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        LOG_ERROR("CATALOG", "Failed to parse catalog JSON: %s", err.c_str());
        return false;
    }

    JsonArrayConst list = doc.as<JsonArrayConst>();
    if (list.isNull()) {
        list = doc["info"]["list"].as<JsonArrayConst>();
    }
    if (list.isNull()) {
        LOG_ERROR("CATALOG", "Catalog JSON has no product list");
        return false;
    }

    std::map<std::string, ModelInfo> models;
    for (JsonObjectConst entry : list) {
        parseCatalogEntry(entry, models);
    }

    _models.swap(models);
    LOG_INFO("CATALOG", "Loaded %zu product(s)", _models.size());
    return true;
}

bool JsonCatalog::loadFile(const char* path) {
    if (path == nullptr) return false;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("CATALOG", "Cannot open catalog file %s", path);
        return false;
    }

    std::stringstream content;
    content << in.rdbuf();
    return load(content.str().c_str());
}

bool JsonCatalog::lookup(const std::string& productId, ModelInfo& out) const {
    std::map<std::string, ModelInfo>::const_iterator it = _models.find(productId);
    if (it == _models.end()) {
        return false;
    }
    out = it->second;
    return true;
}

} // namespace cozyhub

#pragma once
#include <ArduinoJson.h>
#include <map>
#include <string>
#include <vector>

namespace cozyhub {

// Type codes used by the device family
static const char SWITCH_TYPE_CODE[] = "00";
static const char LIGHT_TYPE_CODE[]  = "01";

// Capability metadata for one product id
struct ModelInfo {
    std::string modelName;
    std::string icon;
    std::string typeCode;
    std::vector<int> datapointIds;  // catalog order, no duplicates
};

// Product id -> model metadata lookup, consulted once per INFO exchange
class Catalog {
public:
    virtual ~Catalog() {}

    // Returns false when the product id is unknown
    virtual bool lookup(const std::string& productId, ModelInfo& out) const = 0;
};

// Parse one type entry {"c": "01", "m": [{"pid", "n", "i", "dpid"}]} and add
// its models to models. Returns the number of models added.
int parseCatalogEntry(JsonObjectConst entry, std::map<std::string, ModelInfo>& models);

// Catalog backed by the product-list JSON document: either a top-level array
// of type entries or an object holding it under info.list
class JsonCatalog : public Catalog {
public:
    JsonCatalog() {}

    bool load(const char* json);
    bool loadFile(const char* path);

    bool lookup(const std::string& productId, ModelInfo& out) const override;

    size_t size() const { return _models.size(); }
    void clear() { _models.clear(); }

private:
    std::map<std::string, ModelInfo> _models;
};

} // namespace cozyhub

#include <unity.h>
#include <ArduinoJson.h>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include "devices/catalog.h"

using namespace cozyhub;

static const char* PRODUCT_LIST =
    "[{\"c\":\"01\",\"m\":["
        "{\"pid\":\"e2s64v\",\"n\":\"TestBulb\",\"i\":\"bulb.png\",\"dpid\":[1,2,3,4]},"
        "{\"pid\":\"rgb001\",\"n\":\"Color Bulb\",\"dpid\":[1,2,3,4,5,6,1]}]},"
     "{\"c\":\"00\",\"m\":["
        "{\"pid\":\"sw0001\",\"n\":\"Plug\",\"dpid\":[1]},"
        "{\"n\":\"No pid\",\"dpid\":[1]}]}]";

void setUp(void) {}
void tearDown(void) {}

void test_load_top_level_array(void) {
    JsonCatalog catalog;
    TEST_ASSERT_TRUE(catalog.load(PRODUCT_LIST));
    TEST_ASSERT_EQUAL(3, catalog.size());

    ModelInfo info;
    TEST_ASSERT_TRUE(catalog.lookup("e2s64v", info));
    TEST_ASSERT_EQUAL_STRING("01", info.typeCode.c_str());
    TEST_ASSERT_EQUAL_STRING(LIGHT_TYPE_CODE, info.typeCode.c_str());
    TEST_ASSERT_EQUAL_STRING("TestBulb", info.modelName.c_str());
    TEST_ASSERT_EQUAL_STRING("bulb.png", info.icon.c_str());
    TEST_ASSERT_EQUAL(4, info.datapointIds.size());
    TEST_ASSERT_EQUAL_INT(1, info.datapointIds[0]);
    TEST_ASSERT_EQUAL_INT(4, info.datapointIds[3]);
}

void test_switch_entry(void) {
    JsonCatalog catalog;
    catalog.load(PRODUCT_LIST);

    ModelInfo info;
    TEST_ASSERT_TRUE(catalog.lookup("sw0001", info));
    TEST_ASSERT_EQUAL_STRING(SWITCH_TYPE_CODE, info.typeCode.c_str());
    TEST_ASSERT_EQUAL_STRING("", info.icon.c_str());
}

void test_duplicate_datapoints_removed(void) {
    JsonCatalog catalog;
    catalog.load(PRODUCT_LIST);

    ModelInfo info;
    TEST_ASSERT_TRUE(catalog.lookup("rgb001", info));
    TEST_ASSERT_EQUAL(6, info.datapointIds.size());
    TEST_ASSERT_EQUAL_INT(6, info.datapointIds[5]);
}

void test_lookup_miss(void) {
    JsonCatalog catalog;
    catalog.load(PRODUCT_LIST);

    ModelInfo info;
    info.modelName = "untouched";
    TEST_ASSERT_FALSE(catalog.lookup("nope", info));
    TEST_ASSERT_EQUAL_STRING("untouched", info.modelName.c_str());
}

void test_load_info_list_wrapper(void) {
    JsonCatalog catalog;
    TEST_ASSERT_TRUE(catalog.load(
        "{\"ret\":1,\"info\":{\"list\":[{\"c\":\"01\",\"m\":[{\"pid\":\"p9\",\"dpid\":[1]}]}]}}"));
    TEST_ASSERT_EQUAL(1, catalog.size());
    ModelInfo info;
    TEST_ASSERT_TRUE(catalog.lookup("p9", info));
}

void test_malformed_catalog_keeps_previous(void) {
    JsonCatalog catalog;
    catalog.load(PRODUCT_LIST);

    TEST_ASSERT_FALSE(catalog.load("{not json"));
    TEST_ASSERT_FALSE(catalog.load("{\"info\":{}}"));
    TEST_ASSERT_FALSE(catalog.load(nullptr));
    TEST_ASSERT_EQUAL(3, catalog.size());
}

void test_parse_entry_counts_models(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"c\":\"00\",\"m\":[{\"pid\":\"a\"},{\"pid\":\"\"},{\"pid\":\"b\"}]}");
    std::map<std::string, ModelInfo> models;
    TEST_ASSERT_EQUAL_INT(2, parseCatalogEntry(doc.as<JsonObjectConst>(), models));
    TEST_ASSERT_EQUAL(2, models.size());
    TEST_ASSERT_EQUAL_STRING("00", models["a"].typeCode.c_str());
}

void test_load_file(void) {
    char path[] = "/tmp/cozyhub_catalog_XXXXXX";
    int fd = mkstemp(path);
    TEST_ASSERT_TRUE(fd >= 0);
    FILE* f = fdopen(fd, "w");
    fputs(PRODUCT_LIST, f);
    fclose(f);

    JsonCatalog catalog;
    TEST_ASSERT_TRUE(catalog.loadFile(path));
    TEST_ASSERT_EQUAL(3, catalog.size());
    unlink(path);

    TEST_ASSERT_FALSE(catalog.loadFile("/nonexistent/catalog.json"));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_load_top_level_array);
    RUN_TEST(test_switch_entry);
    RUN_TEST(test_duplicate_datapoints_removed);
    RUN_TEST(test_lookup_miss);
    RUN_TEST(test_load_info_list_wrapper);
    RUN_TEST(test_malformed_catalog_keeps_previous);
    RUN_TEST(test_parse_entry_counts_models);
    RUN_TEST(test_load_file);
    return UNITY_END();
}

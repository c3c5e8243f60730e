#include <unity.h>
#include <ArduinoJson.h>
#include "clock.h"
#include "discovery/udp_discovery.h"
#include "../support/mock_device.h"

using namespace cozyhub;

// Probes go to loopback instead of the LAN broadcast address
static BroadcastConfig loopbackConfig(uint16_t port) {
    BroadcastConfig config = defaultBroadcastConfig();
    config.broadcastAddress = "127.0.0.1";
    config.port = port;
    return config;
}

void setUp(void) {}
void tearDown(void) {}

void test_default_thresholds(void) {
    BroadcastConfig config = defaultBroadcastConfig();
    TEST_ASSERT_EQUAL_STRING("255.255.255.255", config.broadcastAddress.c_str());
    TEST_ASSERT_EQUAL_UINT16(6095, config.port);
    TEST_ASSERT_EQUAL_INT(3, config.sendCount);
    TEST_ASSERT_EQUAL_UINT32(30, config.sendGapMs);
    TEST_ASSERT_EQUAL_INT(5, config.firstReplyAttempts);
    TEST_ASSERT_EQUAL_INT(255, config.maxReplies);
}

void test_probe_is_info_request_without_crlf(void) {
    std::string probe;
    TEST_ASSERT_TRUE(buildDiscoveryProbe("123", probe));
    TEST_ASSERT_EQUAL_STRING("{\"cmd\":0,\"pv\":0,\"sn\":\"123\",\"msg\":{}}", probe.c_str());
}

void test_add_unique_address(void) {
    std::vector<std::string> list;
    TEST_ASSERT_TRUE(addUniqueAddress(list, "10.0.0.2"));
    TEST_ASSERT_TRUE(addUniqueAddress(list, "10.0.0.3"));
    TEST_ASSERT_FALSE(addUniqueAddress(list, "10.0.0.2"));
    TEST_ASSERT_FALSE(addUniqueAddress(list, ""));
    TEST_ASSERT_EQUAL(2, list.size());
}

void test_replies_are_deduplicated(void) {
    mock::MockUdpResponder responder;
    TEST_ASSERT_TRUE(responder.start());

    std::vector<std::string> found = discoverByBroadcast(loopbackConfig(responder.port()));
    TEST_ASSERT_EQUAL(1, found.size());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", found[0].c_str());
    // One reply per probe datagram, collapsed to one address
    TEST_ASSERT_EQUAL_INT(3, responder.probes());

    JsonDocument doc;
    TEST_ASSERT_FALSE(deserializeJson(doc, responder.lastProbe()));
    TEST_ASSERT_EQUAL_INT(0, doc["cmd"].as<int>());
}

void test_no_reply_is_empty_not_error(void) {
    // Bound but silent: nothing answers on this port
    uint16_t port = 0;
    int fd = mock::bindSocket(SOCK_DGRAM, "127.0.0.1", 0, port);
    TEST_ASSERT_TRUE(fd >= 0);
    close(fd);

    BroadcastConfig config = loopbackConfig(port);
    config.firstReplyAttempts = 2;
    config.receiveTimeoutMs = 50;

    unsigned long start = millis();
    std::vector<std::string> found = discoverByBroadcast(config);
    TEST_ASSERT_TRUE(found.empty());
    TEST_ASSERT_TRUE(millis() - start < 1000);
}

void test_cancelled_discovery_returns_promptly(void) {
    mock::MockUdpResponder responder;
    TEST_ASSERT_TRUE(responder.start());

    CancelFlag cancel(true);
    std::vector<std::string> found = discoverByBroadcast(loopbackConfig(responder.port()), &cancel);
    TEST_ASSERT_TRUE(found.empty());
}

void test_invalid_broadcast_address(void) {
    BroadcastConfig config = defaultBroadcastConfig();
    config.broadcastAddress = "not.an.address";
    TEST_ASSERT_TRUE(discoverByBroadcast(config).empty());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_default_thresholds);
    RUN_TEST(test_probe_is_info_request_without_crlf);
    RUN_TEST(test_add_unique_address);
    RUN_TEST(test_replies_are_deduplicated);
    RUN_TEST(test_no_reply_is_empty_not_error);
    RUN_TEST(test_cancelled_discovery_returns_promptly);
    RUN_TEST(test_invalid_broadcast_address);
    return UNITY_END();
}

#include <unity.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>
#include "clock.h"
#include "discovery/subnet_scan.h"
#include "../support/mock_device.h"

using namespace cozyhub;

static int listenFd = -1;
static uint16_t listenPort = 0;

void setUp(void) {
    listenFd = mock::bindSocket(SOCK_STREAM, "127.0.0.1", 0, listenPort);
    TEST_ASSERT_TRUE(listenFd >= 0);
    TEST_ASSERT_EQUAL_INT(0, listen(listenFd, 16));
}

void tearDown(void) {
    if (listenFd >= 0) {
        close(listenFd);
        listenFd = -1;
    }
}

static SubnetScanConfig testConfig(uint16_t port) {
    SubnetScanConfig config = defaultSubnetScanConfig();
    config.port = port;
    config.timeoutMs = 500;
    return config;
}

// --- parseCidr ---

void test_parse_cidr_masks_host_bits(void) {
    uint32_t network = 0;
    int prefix = 0;
    TEST_ASSERT_TRUE(parseCidr("192.168.1.77/24", network, prefix));
    TEST_ASSERT_EQUAL_INT(24, prefix);
    TEST_ASSERT_EQUAL_STRING("192.168.1.0", formatIpv4(network).c_str());
}

void test_parse_cidr_bare_address(void) {
    uint32_t network = 0;
    int prefix = 0;
    TEST_ASSERT_TRUE(parseCidr(" 10.0.0.9 ", network, prefix));
    TEST_ASSERT_EQUAL_INT(32, prefix);
    TEST_ASSERT_EQUAL_STRING("10.0.0.9", formatIpv4(network).c_str());
}

void test_parse_cidr_rejects_malformed(void) {
    uint32_t network = 0;
    int prefix = 0;
    TEST_ASSERT_FALSE(parseCidr("192.168.1.0/33", network, prefix));
    TEST_ASSERT_FALSE(parseCidr("192.168.1.0/", network, prefix));
    TEST_ASSERT_FALSE(parseCidr("192.168.1.0/a", network, prefix));
    TEST_ASSERT_FALSE(parseCidr("192.168.1/24", network, prefix));
    TEST_ASSERT_FALSE(parseCidr("garbage", network, prefix));
    TEST_ASSERT_FALSE(parseCidr("", network, prefix));
    TEST_ASSERT_FALSE(parseCidr(nullptr, network, prefix));
}

// --- enumerateHosts ---

void test_enumerate_excludes_network_and_broadcast(void) {
    std::vector<std::string> hosts;
    TEST_ASSERT_TRUE(enumerateHosts("192.168.1.0/30", hosts, 1024));
    TEST_ASSERT_EQUAL(2, hosts.size());
    TEST_ASSERT_EQUAL_STRING("192.168.1.1", hosts[0].c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.1.2", hosts[1].c_str());
}

void test_enumerate_slash_24(void) {
    std::vector<std::string> hosts;
    TEST_ASSERT_TRUE(enumerateHosts("10.1.2.0/24", hosts, 1024));
    TEST_ASSERT_EQUAL(254, hosts.size());
    TEST_ASSERT_EQUAL_STRING("10.1.2.1", hosts.front().c_str());
    TEST_ASSERT_EQUAL_STRING("10.1.2.254", hosts.back().c_str());
}

void test_enumerate_point_to_point_and_single(void) {
    std::vector<std::string> hosts;
    TEST_ASSERT_TRUE(enumerateHosts("10.0.0.4/31", hosts, 1024));
    TEST_ASSERT_EQUAL(2, hosts.size());
    TEST_ASSERT_EQUAL_STRING("10.0.0.4", hosts[0].c_str());
    TEST_ASSERT_EQUAL_STRING("10.0.0.5", hosts[1].c_str());

    TEST_ASSERT_TRUE(enumerateHosts("10.0.0.7/32", hosts, 1024));
    TEST_ASSERT_EQUAL(1, hosts.size());
    TEST_ASSERT_EQUAL_STRING("10.0.0.7", hosts[0].c_str());
}

void test_enumerate_refuses_oversized_range(void) {
    std::vector<std::string> hosts;
    TEST_ASSERT_FALSE(enumerateHosts("10.0.0.0/8", hosts, 65536));
    TEST_ASSERT_TRUE(hosts.empty());
}

void test_enumerate_malformed(void) {
    std::vector<std::string> hosts;
    hosts.push_back("stale");
    TEST_ASSERT_FALSE(enumerateHosts("1.2.3.4/99", hosts, 1024));
    TEST_ASSERT_TRUE(hosts.empty());
}

// --- probe ---

void test_scan_finds_single_listening_host(void) {
    std::vector<std::string> found = scanSubnet("127.0.0.0/30", testConfig(listenPort));
    TEST_ASSERT_EQUAL(1, found.size());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", found[0].c_str());
}

void test_scan_without_listener_is_empty(void) {
    close(listenFd);
    listenFd = -1;

    std::vector<std::string> found = scanSubnet("127.0.0.0/30", testConfig(listenPort));
    TEST_ASSERT_TRUE(found.empty());
}

void test_scan_malformed_is_empty(void) {
    TEST_ASSERT_TRUE(scanSubnet("127.0.0.0/xx", testConfig(listenPort)).empty());
}

void test_probe_batch_limit(void) {
    TEST_ASSERT_EQUAL(1, probeBatchLimit(1, 500));
    TEST_ASSERT_EQUAL(10, probeBatchLimit(0, 10));
    TEST_ASSERT_EQUAL(1, probeBatchLimit(0, 0));

    struct rlimit limit;
    TEST_ASSERT_EQUAL_INT(0, getrlimit(RLIMIT_NOFILE, &limit));
    size_t capped = probeBatchLimit(1000000, 1000000);
    TEST_ASSERT_TRUE(capped >= 1);
    if (limit.rlim_cur != RLIM_INFINITY && limit.rlim_cur < 1000000) {
        TEST_ASSERT_TRUE(capped <= (size_t)limit.rlim_cur);
        TEST_ASSERT_TRUE(capped < 1000000);
    }
}

void test_probe_keeps_input_order_across_batches(void) {
    std::vector<std::string> hosts;
    hosts.push_back("127.0.0.3");
    hosts.push_back("127.0.0.1");
    hosts.push_back("127.0.0.2");
    hosts.push_back("127.0.0.1");

    std::vector<std::string> found = probeHosts(hosts, listenPort, 500, 1);
    TEST_ASSERT_EQUAL(2, found.size());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", found[0].c_str());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", found[1].c_str());
}

void test_probe_is_bounded_by_timeout(void) {
    std::vector<std::string> hosts;
    enumerateHosts("127.0.0.0/28", hosts, 1024);

    unsigned long start = millis();
    probeHosts(hosts, listenPort, 300, 256);
    TEST_ASSERT_TRUE(millis() - start < 1500);
}

void test_cancelled_probe_finds_nothing_pending(void) {
    CancelFlag cancel(true);
    std::vector<std::string> hosts;
    hosts.push_back("127.0.0.1");
    std::vector<std::string> found = probeHosts(hosts, listenPort, 500, 16, &cancel);
    TEST_ASSERT_TRUE(found.empty());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_parse_cidr_masks_host_bits);
    RUN_TEST(test_parse_cidr_bare_address);
    RUN_TEST(test_parse_cidr_rejects_malformed);
    RUN_TEST(test_enumerate_excludes_network_and_broadcast);
    RUN_TEST(test_enumerate_slash_24);
    RUN_TEST(test_enumerate_point_to_point_and_single);
    RUN_TEST(test_enumerate_refuses_oversized_range);
    RUN_TEST(test_enumerate_malformed);
    RUN_TEST(test_scan_finds_single_listening_host);
    RUN_TEST(test_scan_without_listener_is_empty);
    RUN_TEST(test_scan_malformed_is_empty);
    RUN_TEST(test_probe_batch_limit);
    RUN_TEST(test_probe_keeps_input_order_across_batches);
    RUN_TEST(test_probe_is_bounded_by_timeout);
    RUN_TEST(test_cancelled_probe_finds_nothing_pending);
    return UNITY_END();
}

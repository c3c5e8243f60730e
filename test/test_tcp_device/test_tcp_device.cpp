#include <unity.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string>
#include "config.h"
#include "devices/tcp_device.h"
#include "../support/mock_device.h"

using namespace cozyhub;

static int listenFd = -1;
static int peerFd = -1;
static uint16_t listenPort = 0;

void setUp(void) {
    listenFd = mock::bindSocket(SOCK_STREAM, "127.0.0.1", 0, listenPort);
    TEST_ASSERT_TRUE(listenFd >= 0);
    TEST_ASSERT_EQUAL_INT(0, listen(listenFd, 4));
}

void tearDown(void) {
    if (peerFd >= 0) { close(peerFd); peerFd = -1; }
    if (listenFd >= 0) { close(listenFd); listenFd = -1; }
}

static void connectPair(TcpDevice& tcp) {
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.connect("127.0.0.1", listenPort, 1000));
    peerFd = accept(listenFd, nullptr, nullptr);
    TEST_ASSERT_TRUE(peerFd >= 0);
}

static void peerWrite(const char* text) {
    std::string s(text);
    TEST_ASSERT_EQUAL_INT((int)s.size(), (int)::send(peerFd, s.data(), s.size(), MSG_NOSIGNAL));
}

// --- connect ---

void test_connect_and_disconnect(void) {
    TcpDevice tcp;
    connectPair(tcp);
    TEST_ASSERT_TRUE(tcp.isConnected());
    TEST_ASSERT_EQUAL_STRING("127.0.0.1", tcp.host().c_str());
    TEST_ASSERT_EQUAL_UINT16(listenPort, tcp.port());

    tcp.disconnect();
    TEST_ASSERT_FALSE(tcp.isConnected());
    tcp.disconnect();
    TEST_ASSERT_FALSE(tcp.isConnected());
}

void test_connect_refused(void) {
    close(listenFd);
    listenFd = -1;

    TcpDevice tcp;
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.connect("127.0.0.1", listenPort, 1000));
    TEST_ASSERT_FALSE(tcp.isConnected());
}

void test_connect_invalid_address(void) {
    TcpDevice tcp;
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.connect("not-an-ip", 5555, 100));
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.connect(nullptr, 5555, 100));
}

// --- send ---

void test_send_reaches_peer(void) {
    TcpDevice tcp;
    connectPair(tcp);
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.sendString("hello\r\n", 1000));

    char buf[16] = {0};
    TEST_ASSERT_TRUE(mock::waitReadable(peerFd, 1000));
    ssize_t n = recv(peerFd, buf, sizeof(buf) - 1, 0);
    TEST_ASSERT_EQUAL_INT(7, (int)n);
    TEST_ASSERT_EQUAL_STRING("hello\r\n", buf);
}

void test_send_when_disconnected(void) {
    TcpDevice tcp;
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.sendString("x", 100));
}

// --- receiveLine ---

void test_receive_lines_split_and_buffered(void) {
    TcpDevice tcp;
    connectPair(tcp);
    peerWrite("{\"a\":1}\r\n{\"b\":2}\n");

    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.receiveLine(line, 1000));
    TEST_ASSERT_EQUAL_STRING("{\"a\":1}", line.c_str());
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.receiveLine(line, 1000));
    TEST_ASSERT_EQUAL_STRING("{\"b\":2}", line.c_str());
}

void test_partial_line_survives_timeout(void) {
    TcpDevice tcp;
    connectPair(tcp);
    peerWrite("{\"par");

    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::TIMEOUT, tcp.receiveLine(line, 100));

    peerWrite("tial\":1}\r\n");
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.receiveLine(line, 1000));
    TEST_ASSERT_EQUAL_STRING("{\"partial\":1}", line.c_str());
}

void test_discard_input_drops_buffered_bytes(void) {
    TcpDevice tcp;
    connectPair(tcp);
    peerWrite("stale");

    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::TIMEOUT, tcp.receiveLine(line, 100));
    tcp.discardInput();

    peerWrite("fresh\r\n");
    TEST_ASSERT_EQUAL(IoStatus::OK, tcp.receiveLine(line, 1000));
    TEST_ASSERT_EQUAL_STRING("fresh", line.c_str());
}

void test_receive_peer_closed(void) {
    TcpDevice tcp;
    connectPair(tcp);
    close(peerFd);
    peerFd = -1;

    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::CLOSED, tcp.receiveLine(line, 1000));
}

void test_receive_overlong_line_fails(void) {
    TcpDevice tcp;
    connectPair(tcp);
    std::string big(SESSION_MAX_LINE_LENGTH + 600, 'x');
    peerWrite(big.c_str());

    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.receiveLine(line, 1000));
}

void test_receive_when_disconnected(void) {
    TcpDevice tcp;
    std::string line;
    TEST_ASSERT_EQUAL(IoStatus::FAILED, tcp.receiveLine(line, 100));
}

void test_io_status_names(void) {
    TEST_ASSERT_EQUAL_STRING("ok", ioStatusToString(IoStatus::OK));
    TEST_ASSERT_EQUAL_STRING("timeout", ioStatusToString(IoStatus::TIMEOUT));
    TEST_ASSERT_EQUAL_STRING("closed", ioStatusToString(IoStatus::CLOSED));
    TEST_ASSERT_EQUAL_STRING("cancelled", ioStatusToString(IoStatus::CANCELLED));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_connect_and_disconnect);
    RUN_TEST(test_connect_refused);
    RUN_TEST(test_connect_invalid_address);
    RUN_TEST(test_send_reaches_peer);
    RUN_TEST(test_send_when_disconnected);
    RUN_TEST(test_receive_lines_split_and_buffered);
    RUN_TEST(test_partial_line_survives_timeout);
    RUN_TEST(test_discard_input_drops_buffered_bytes);
    RUN_TEST(test_receive_peer_closed);
    RUN_TEST(test_receive_overlong_line_fails);
    RUN_TEST(test_receive_when_disconnected);
    RUN_TEST(test_io_status_names);
    return UNITY_END();
}

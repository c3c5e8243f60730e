#include "udp_discovery.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include "../config.h"
#include "../debug_log.h"
#include "../devices/tcp_device.h"
#include "../messaging/envelope.h"

namespace cozyhub {

static const size_t DATAGRAM_BUFFER_SIZE = 1024;

namespace {

struct SocketCloser {
    int fd;
    explicit SocketCloser(int f) : fd(f) {}
    ~SocketCloser() { closeSocket(fd); }
};

// POLLIN within timeoutMs
bool waitReadable(int fd, unsigned long timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc;
    do {
        rc = ::poll(&pfd, 1, (int)timeoutMs);
    } while (rc < 0 && errno == EINTR);
    return rc > 0 && (pfd.revents & POLLIN);
}

} // namespace

BroadcastConfig defaultBroadcastConfig() {
    BroadcastConfig config;
    config.broadcastAddress = DISCOVERY_BROADCAST_ADDRESS;
    config.port = DISCOVERY_UDP_PORT;
    config.sendCount = DISCOVERY_SEND_COUNT;
    config.sendGapMs = DISCOVERY_SEND_GAP_MS;
    config.firstReplyAttempts = DISCOVERY_FIRST_REPLY_TRIES;
    config.receiveTimeoutMs = DISCOVERY_RECEIVE_TIMEOUT_MS;
    config.maxReplies = DISCOVERY_MAX_REPLIES;
    return config;
}

bool addUniqueAddress(std::vector<std::string>& list, const std::string& address) {
    if (address.empty()) return false;
    if (std::find(list.begin(), list.end(), address) != list.end()) {
        return false;
    }
    list.push_back(address);
    return true;
}

bool buildDiscoveryProbe(const std::string& sn, std::string& out) {
    JsonDocument doc;
    if (!buildRequest(doc, (int)Command::INFO, sn, DatapointMap())) {
        return false;
    }
    out.clear();
    serializeJson(doc, out);
    return true;
}

std::vector<std::string> discoverByBroadcast(const BroadcastConfig& config,
                                             const CancelFlag* cancel) {
    std::vector<std::string> found;

    sockaddr_in dest;
    memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(config.port);
    if (inet_pton(AF_INET, config.broadcastAddress.c_str(), &dest.sin_addr) != 1) {
        LOG_ERROR("UDP", "Invalid broadcast address: %s", config.broadcastAddress.c_str());
        return found;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd < 0) {
        LOG_ERROR("UDP", "socket() failed: %s", strerror(errno));
        return found;
    }
    SocketCloser closer(fd);

    int on = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0) {
        LOG_ERROR("UDP", "setsockopt() failed: %s", strerror(errno));
        return found;
    }

    SequenceGenerator sequence;
    std::string probe;
    if (!buildDiscoveryProbe(sequence.next(), probe)) {
        return found;
    }

    int sent = 0;
    for (int i = 0; i < config.sendCount; i++) {
        ssize_t n = ::sendto(fd, probe.data(), probe.size(), 0,
                             reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (n < 0) {
            LOG_ERROR("UDP", "sendto(%s:%u) failed: %s",
                      config.broadcastAddress.c_str(), config.port, strerror(errno));
        } else {
            sent++;
        }
        delayMs(config.sendGapMs);
    }
    if (sent == 0) {
        return found;
    }
    LOG_DEBUG("UDP", "Sent %d probe(s) to %s:%u", sent, config.broadcastAddress.c_str(), config.port);

    // Phase 1: any first reply, without consuming it
    bool gotReply = false;
    for (int attempt = 1; attempt <= config.firstReplyAttempts; attempt++) {
        if (isCancelled(cancel)) return found;
        if (waitReadable(fd, config.receiveTimeoutMs)) {
            gotReply = true;
            break;
        }
        LOG_DEBUG("UDP", "%d/%d try, udp timeout", attempt, config.firstReplyAttempts);
    }
    if (!gotReply) {
        LOG_INFO("UDP", "No device answered the broadcast probe");
        return found;
    }

    // Phase 2: drain replies until quiet, capped both in distinct addresses
    // and in datagrams so a chatty device cannot keep us here
    int datagramBudget = config.maxReplies * (config.sendCount > 0 ? config.sendCount : 1);
    char buf[DATAGRAM_BUFFER_SIZE];
    while ((int)found.size() < config.maxReplies && datagramBudget > 0) {
        if (isCancelled(cancel)) break;
        if (!waitReadable(fd, config.receiveTimeoutMs)) {
            LOG_DEBUG("UDP", "udp timeout");
            break;
        }

        sockaddr_in from;
        socklen_t fromLen = sizeof(from);
        ssize_t n = ::recvfrom(fd, buf, sizeof(buf), 0,
                               reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("UDP", "recvfrom() failed: %s", strerror(errno));
            break;
        }
        datagramBudget--;

        char addr[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr)) == nullptr) {
            continue;
        }
        if (addUniqueAddress(found, addr)) {
            LOG_INFO("UDP", "Reply from %s", addr);
        }
    }

    return found;
}

} // namespace cozyhub

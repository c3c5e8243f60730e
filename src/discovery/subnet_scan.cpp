#include "subnet_scan.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/resource.h>
#include "../config.h"
#include "../debug_log.h"
#include "../devices/tcp_device.h"

namespace cozyhub {

SubnetScanConfig defaultSubnetScanConfig() {
    SubnetScanConfig config;
    config.port = DEVICE_TCP_PORT;
    config.timeoutMs = SUBNET_PROBE_TIMEOUT_MS;
    config.batchSize = SUBNET_PROBE_BATCH_SIZE;
    config.maxHosts = SUBNET_MAX_HOSTS;
    return config;
}

bool parseCidr(const char* cidr, uint32_t& network, int& prefix) {
    if (cidr == nullptr) return false;

    // Trim surrounding whitespace
    while (*cidr == ' ' || *cidr == '\t') cidr++;
    size_t len = strlen(cidr);
    while (len > 0 && (cidr[len - 1] == ' ' || cidr[len - 1] == '\t')) len--;

    char buf[32];
    if (len == 0 || len >= sizeof(buf)) return false;
    memcpy(buf, cidr, len);
    buf[len] = '\0';

    int bits = 32;
    char* slash = strchr(buf, '/');
    if (slash != nullptr) {
        *slash = '\0';
        const char* digits = slash + 1;
        size_t n = strlen(digits);
        if (n == 0 || n > 2) return false;
        for (size_t i = 0; i < n; i++) {
            if (digits[i] < '0' || digits[i] > '9') return false;
        }
        bits = atoi(digits);
        if (bits > 32) return false;
    }

    in_addr addr;
    if (inet_pton(AF_INET, buf, &addr) != 1) return false;

    uint32_t mask = bits == 0 ? 0 : (0xFFFFFFFFu << (32 - bits));
    network = ntohl(addr.s_addr) & mask;
    prefix = bits;
    return true;
}

std::string formatIpv4(uint32_t address) {
    char buf[INET_ADDRSTRLEN];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
             (unsigned)((address >> 24) & 0xFF), (unsigned)((address >> 16) & 0xFF),
             (unsigned)((address >> 8) & 0xFF), (unsigned)(address & 0xFF));
    return buf;
}

bool enumerateHosts(const char* cidr, std::vector<std::string>& hosts, uint32_t maxHosts) {
    hosts.clear();

    uint32_t network = 0;
    int prefix = 0;
    if (!parseCidr(cidr, network, prefix)) {
        LOG_ERROR("SCAN", "Invalid subnet format '%s'", cidr != nullptr ? cidr : "");
        return false;
    }

    uint64_t size = (uint64_t)1 << (32 - prefix);
    uint64_t first = network;
    uint64_t count = size;
    if (prefix < 31) {
        first = (uint64_t)network + 1;
        count = size - 2;
    }

    if (count > maxHosts) {
        LOG_ERROR("SCAN", "Subnet %s has %llu hosts, limit is %u",
                  cidr, (unsigned long long)count, (unsigned)maxHosts);
        return false;
    }

    hosts.reserve((size_t)count);
    for (uint64_t i = 0; i < count; i++) {
        hosts.push_back(formatIpv4((uint32_t)(first + i)));
    }
    return true;
}

struct PendingProbe {
    int fd;
    size_t index;
};

// One batch: start every connect, then wait for all of them together
static void probeBatch(const std::vector<std::string>& hosts, size_t begin, size_t end,
                       uint16_t port, unsigned long timeoutMs,
                       std::vector<bool>& accepted, const CancelFlag* cancel) {
    std::vector<PendingProbe> pending;
    pending.reserve(end - begin);

    for (size_t i = begin; i < end; i++) {
        bool connected = false;
        int fd = beginConnect(hosts[i].c_str(), port, connected);
        if (fd < 0) continue;
        if (connected) {
            accepted[i] = true;
            closeSocket(fd);
            continue;
        }
        PendingProbe probe;
        probe.fd = fd;
        probe.index = i;
        pending.push_back(probe);
    }

    unsigned long start = millis();
    std::vector<pollfd> fds;
    while (!pending.empty()) {
        unsigned long remaining = remainingMs(start, timeoutMs, millis());
        if (remaining == 0 || isCancelled(cancel)) break;

        fds.resize(pending.size());
        for (size_t i = 0; i < pending.size(); i++) {
            fds[i].fd = pending[i].fd;
            fds[i].events = POLLOUT;
            fds[i].revents = 0;
        }

        unsigned long slice = remaining < CANCEL_POLL_SLICE_MS ? remaining : CANCEL_POLL_SLICE_MS;
        int rc = ::poll(&fds[0], fds.size(), (int)slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("SCAN", "poll() failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;

        std::vector<PendingProbe> still;
        still.reserve(pending.size());
        for (size_t i = 0; i < pending.size(); i++) {
            if (fds[i].revents == 0) {
                still.push_back(pending[i]);
                continue;
            }
            if (connectSucceeded(pending[i].fd)) {
                accepted[pending[i].index] = true;
            }
            closeSocket(pending[i].fd);
        }
        pending.swap(still);
    }

    for (size_t i = 0; i < pending.size(); i++) {
        closeSocket(pending[i].fd);
    }
}

size_t probeBatchLimit(int requested, size_t hostCount) {
    size_t batch = requested > 0 ? (size_t)requested : hostCount;

    struct rlimit limit;
    if (getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        size_t usable = limit.rlim_cur > SUBNET_PROBE_FD_RESERVE
                            ? (size_t)(limit.rlim_cur - SUBNET_PROBE_FD_RESERVE) : 1;
        if (batch > usable) {
            LOG_DEBUG("SCAN", "Probe batch %zu capped to %zu by the open-file limit", batch, usable);
            batch = usable;
        }
    }
    return batch > 0 ? batch : 1;
}

std::vector<std::string> probeHosts(const std::vector<std::string>& hosts, uint16_t port,
                                    unsigned long timeoutMs, int batchSize,
                                    const CancelFlag* cancel) {
    std::vector<bool> accepted(hosts.size(), false);
    size_t batch = probeBatchLimit(batchSize, hosts.size());

    for (size_t begin = 0; begin < hosts.size(); begin += batch) {
        if (isCancelled(cancel)) break;
        size_t end = begin + batch < hosts.size() ? begin + batch : hosts.size();
        probeBatch(hosts, begin, end, port, timeoutMs, accepted, cancel);
    }

    std::vector<std::string> found;
    for (size_t i = 0; i < hosts.size(); i++) {
        if (accepted[i]) {
            found.push_back(hosts[i]);
        }
    }
    return found;
}

std::vector<std::string> scanSubnet(const char* cidr, const SubnetScanConfig& config,
                                    const CancelFlag* cancel) {
    std::vector<std::string> hosts;
    if (!enumerateHosts(cidr, hosts, config.maxHosts)) {
        return std::vector<std::string>();
    }

    LOG_INFO("SCAN", "Scanning subnet %s (%zu hosts, port %u)", cidr, hosts.size(), config.port);
    std::vector<std::string> found = probeHosts(hosts, config.port, config.timeoutMs,
                                                config.batchSize, cancel);
    for (size_t i = 0; i < found.size(); i++) {
        LOG_INFO("SCAN", "Found device at %s", found[i].c_str());
    }
    return found;
}

} // namespace cozyhub

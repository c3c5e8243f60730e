#include "tcp_device.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include "../config.h"
#include "../debug_log.h"

namespace cozyhub {

const char* ioStatusToString(IoStatus status) {
    switch (status) {
        case IoStatus::OK:        return "ok";
        case IoStatus::TIMEOUT:   return "timeout";
        case IoStatus::CLOSED:    return "closed";
        case IoStatus::FAILED:    return "failed";
        case IoStatus::CANCELLED: return "cancelled";
        default:                  return "unknown";
    }
}

int beginConnect(const char* host, uint16_t port, bool& connected) {
    connected = false;
    if (host == nullptr) return -1;

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
        LOG_ERROR("TCP", "Invalid IPv4 address: %s", host);
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        LOG_ERROR("TCP", "socket() failed: %s", strerror(errno));
        return -1;
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        connected = true;
        return fd;
    }
    if (errno == EINPROGRESS) {
        return fd;
    }

    LOG_TRACE("TCP", "connect(%s:%u) failed: %s", host, port, strerror(errno));
    ::close(fd);
    return -1;
}

bool connectSucceeded(int fd) {
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        return false;
    }
    return err == 0;
}

void closeSocket(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

TcpDevice::TcpDevice() : _fd(-1), _port(0) {}

TcpDevice::~TcpDevice() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

IoStatus TcpDevice::connect(const char* host, uint16_t port, unsigned long timeoutMs,
                            const CancelFlag* cancel) {
    if (_fd >= 0) {
        disconnect();
    }

    _host = host != nullptr ? host : "";
    _port = port;
    _rxBuffer.clear();

    LOG_DEBUG("TCP", "Connecting to %s:%u", _host.c_str(), port);

    bool connected = false;
    int fd = beginConnect(_host.c_str(), port, connected);
    if (fd < 0) {
        return IoStatus::FAILED;
    }

    unsigned long start = millis();
    while (!connected) {
        if (isCancelled(cancel)) {
            ::close(fd);
            return IoStatus::CANCELLED;
        }

        unsigned long remaining = remainingMs(start, timeoutMs, millis());
        if (remaining == 0) {
            LOG_DEBUG("TCP", "Connect timeout to %s:%u (%lums)", _host.c_str(), port, timeoutMs);
            ::close(fd);
            return IoStatus::TIMEOUT;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        unsigned long slice = remaining < CANCEL_POLL_SLICE_MS ? remaining : CANCEL_POLL_SLICE_MS;
        int rc = ::poll(&pfd, 1, (int)slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("TCP", "poll() failed: %s", strerror(errno));
            ::close(fd);
            return IoStatus::FAILED;
        }
        if (rc == 0) continue;

        if (!connectSucceeded(fd)) {
            LOG_DEBUG("TCP", "Connection failed to %s:%u", _host.c_str(), port);
            ::close(fd);
            return IoStatus::FAILED;
        }
        connected = true;
    }

    _fd = fd;
    LOG_DEBUG("TCP", "Connected to %s:%u", _host.c_str(), port);
    return IoStatus::OK;
}

void TcpDevice::disconnect() {
    if (_fd < 0) return;

    ::close(_fd);
    _fd = -1;
    _rxBuffer.clear();
    LOG_DEBUG("TCP", "Disconnected from %s:%u", _host.empty() ? "?" : _host.c_str(), _port);
}

IoStatus TcpDevice::send(const char* data, size_t len, unsigned long timeoutMs) {
    if (_fd < 0) {
        LOG_ERROR("TCP", "Send failed: not connected");
        return IoStatus::FAILED;
    }

    unsigned long start = millis();
    size_t pos = 0;

    while (pos < len) {
        ssize_t n = ::send(_fd, data + pos, len - pos, MSG_NOSIGNAL);
        if (n > 0) {
            pos += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_ERROR("TCP", "Send to %s failed: %s", _host.c_str(), strerror(errno));
            return errno == EPIPE || errno == ECONNRESET ? IoStatus::CLOSED : IoStatus::FAILED;
        }

        unsigned long remaining = remainingMs(start, timeoutMs, millis());
        if (remaining == 0) {
            LOG_ERROR("TCP", "Send to %s timed out (%zu/%zu bytes)", _host.c_str(), pos, len);
            return IoStatus::TIMEOUT;
        }

        pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        if (::poll(&pfd, 1, (int)remaining) < 0 && errno != EINTR) {
            return IoStatus::FAILED;
        }
    }

    LOG_TRACE("TCP", "TX %zu bytes", pos);
    return IoStatus::OK;
}

IoStatus TcpDevice::sendString(const std::string& str, unsigned long timeoutMs) {
    return send(str.data(), str.size(), timeoutMs);
}

bool TcpDevice::takeLine(std::string& line) {
    size_t nl = _rxBuffer.find('\n');
    if (nl == std::string::npos) return false;

    line.assign(_rxBuffer, 0, nl);
    _rxBuffer.erase(0, nl + 1);
    if (!line.empty() && line[line.size() - 1] == '\r') {
        line.erase(line.size() - 1);
    }
    return true;
}

IoStatus TcpDevice::receiveLine(std::string& line, unsigned long timeoutMs) {
    if (_fd < 0) {
        LOG_ERROR("TCP", "ReceiveLine failed: not connected");
        return IoStatus::FAILED;
    }

    unsigned long start = millis();
    char chunk[512];

    while (!takeLine(line)) {
        if (_rxBuffer.size() > SESSION_MAX_LINE_LENGTH) {
            LOG_ERROR("TCP", "Line from %s exceeds %d bytes", _host.c_str(), SESSION_MAX_LINE_LENGTH);
            _rxBuffer.clear();
            return IoStatus::FAILED;
        }

        unsigned long remaining = remainingMs(start, timeoutMs, millis());
        if (remaining == 0) {
            LOG_DEBUG("TCP", "ReceiveLine timeout (%lums), partial: %zu bytes",
                      timeoutMs, _rxBuffer.size());
            return IoStatus::TIMEOUT;
        }

        pollfd pfd;
        pfd.fd = _fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, (int)remaining);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return IoStatus::FAILED;
        }
        if (rc == 0) continue;

        ssize_t n = ::recv(_fd, chunk, sizeof(chunk), 0);
        if (n == 0) {
            LOG_INFO("TCP", "Connection closed by %s", _host.c_str());
            return IoStatus::CLOSED;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            LOG_ERROR("TCP", "Receive from %s failed: %s", _host.c_str(), strerror(errno));
            return IoStatus::FAILED;
        }

        _rxBuffer.append(chunk, (size_t)n);
    }

    LOG_TRACE("TCP", "RX line: %s", line.c_str());
    return IoStatus::OK;
}

} // namespace cozyhub

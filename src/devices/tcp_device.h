#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "../clock.h"

namespace cozyhub {

// Outcome of a socket operation
enum class IoStatus : uint8_t {
    OK        = 0,
    TIMEOUT   = 1,
    CLOSED    = 2,  // peer closed the connection
    FAILED    = 3,  // socket error, refused, unreachable, overflow
    CANCELLED = 4
};

const char* ioStatusToString(IoStatus status);

// Start a non-blocking TCP connect to a dotted IPv4 host.
// Returns the socket fd, or -1 if the address is invalid or the connect
// failed immediately. connected is set when the connect completed at once.
int beginConnect(const char* host, uint16_t port, bool& connected);

// True once a pending non-blocking connect on fd completed without error
bool connectSucceeded(int fd);

void closeSocket(int fd);

class TcpDevice {
public:
    TcpDevice();
    ~TcpDevice();

    TcpDevice(const TcpDevice&) = delete;
    TcpDevice& operator=(const TcpDevice&) = delete;

    // Connect to host:port, bounded by timeoutMs. Any previous connection is closed.
    IoStatus connect(const char* host, uint16_t port, unsigned long timeoutMs,
                     const CancelFlag* cancel = nullptr);
    bool isConnected() const { return _fd >= 0; }
    void disconnect();

    // Write all bytes, waiting at most timeoutMs for the socket to drain
    IoStatus send(const char* data, size_t len, unsigned long timeoutMs);
    IoStatus sendString(const std::string& str, unsigned long timeoutMs);

    // Receive one line terminated by '\n'; a trailing '\r' is stripped.
    // Bytes after the terminator stay buffered for the next call, as do the
    // bytes of a line still incomplete when timeoutMs expires.
    IoStatus receiveLine(std::string& line, unsigned long timeoutMs);

    // Drop anything buffered but not yet returned
    void discardInput() { _rxBuffer.clear(); }

    const std::string& host() const { return _host; }
    uint16_t port() const { return _port; }

private:
    int _fd;
    std::string _host;
    uint16_t _port;
    std::string _rxBuffer;

    bool takeLine(std::string& line);
};

} // namespace cozyhub

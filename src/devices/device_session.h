#pragma once
#include <ArduinoJson.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "catalog.h"
#include "tcp_device.h"
#include "../clock.h"
#include "../messaging/datapoints.h"
#include "../messaging/envelope.h"

namespace cozyhub {

// Connection lifecycle: DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTED
enum class SessionState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING   = 1,
    CONNECTED    = 2
};

enum class SessionError : uint8_t {
    NONE              = 0,
    NOT_CONNECTED     = 1,  // no I/O attempted
    TIMEOUT           = 2,  // connect timeout, or every response attempt timed out
    IO_FAILURE        = 3,  // refused, reset, write/read error; session disconnected
    PROTOCOL_MISMATCH = 4,  // only stale/malformed replies, or a reply without the expected body
    INVALID_COMMAND   = 5,  // command kind outside INFO/QUERY/SET
    INVALID_PAYLOAD   = 6,  // empty control payload or datapoint out of range
    CANCELLED         = 7
};

const char* sessionStateToString(SessionState state);
const char* sessionErrorToString(SessionError error);

struct SessionConfig {
    uint16_t port;
    unsigned long connectTimeoutMs;
    unsigned long responseTimeoutMs;  // per response attempt
    int queryAttempts;
};

SessionConfig defaultSessionConfig();

// Identity and capability snapshot of one device
struct Device {
    std::string id;               // "did", assigned by the device
    std::string productId;        // "pid"
    std::string typeCode;         // from the catalog
    std::string modelName;
    std::string icon;
    std::vector<int> datapointIds;
    std::string softwareVersion;  // "sv", "Unknown" until reported
    std::string host;             // empty while disconnected
    uint16_t port;
    bool available;
    bool identified;              // an INFO reply carried did and pid

    Device();
};

struct SessionStats {
    int requestsSent;
    int responsesMatched;
    int staleResponses;   // dropped for sn mismatch or bad JSON
    int reconnects;
};

// Owns the TCP connection to one device. Requests are serialized: a request
// holds the I/O lock from write until its matching response or timeout.
// All methods are safe to call from any thread.
class DeviceSession {
public:
    explicit DeviceSession(const Catalog* catalog,
                           const SessionConfig& config = defaultSessionConfig());
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Open the connection and run one INFO exchange. Never throws; on failure
    // the session is DISCONNECTED and unavailable.
    SessionError connect(const std::string& host, const CancelFlag* cancel = nullptr);

    // connect() to the last target host
    SessionError reconnect(const CancelFlag* cancel = nullptr);

    // Close the connection if open. Idempotent.
    void disconnect();

    // QUERY all datapoints. out is empty unless NONE is returned.
    SessionError query(DatapointMap& out);

    // SET the given datapoints without waiting for a reply
    SessionError control(const DatapointMap& payload);

    Device device() const;
    std::string id() const;
    std::string typeCode() const;
    std::string targetHost() const;
    bool isAvailable() const;
    bool isIdentified() const;
    SessionState state() const;
    SessionError lastError() const;
    SessionStats stats() const;

private:
    const Catalog* _catalog;
    SessionConfig _config;
    TcpDevice _socket;
    SequenceGenerator _sequence;

    // Held for a whole request/response; taken before _stateMutex, never after
    std::mutex _ioMutex;

    mutable std::mutex _stateMutex;
    Device _device;
    SessionState _state;
    SessionError _lastError;
    std::string _targetHost;
    SessionStats _stats;
    bool _hasConnected;

    SessionError exchange(Command cmd, const DatapointMap& payload,
                          JsonDocument& response, const CancelFlag* cancel);
    SessionError identify(const CancelFlag* cancel);
    void applyInfo(const InfoReply& info);
    void closeLocked(SessionError reason);
    void markResult(SessionError error, bool available);
};

} // namespace cozyhub

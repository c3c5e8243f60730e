#include "device_session.h"
#include <cstdio>
#include "../config.h"
#include "../debug_log.h"

namespace cozyhub {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "DISCONNECTED";
        case SessionState::CONNECTING:   return "CONNECTING";
        case SessionState::CONNECTED:    return "CONNECTED";
        default:                         return "UNKNOWN";
    }
}

const char* sessionErrorToString(SessionError error) {
    switch (error) {
        case SessionError::NONE:              return "none";
        case SessionError::NOT_CONNECTED:     return "not_connected";
        case SessionError::TIMEOUT:           return "timeout";
        case SessionError::IO_FAILURE:        return "io_failure";
        case SessionError::PROTOCOL_MISMATCH: return "protocol_mismatch";
        case SessionError::INVALID_COMMAND:   return "invalid_command";
        case SessionError::INVALID_PAYLOAD:   return "invalid_payload";
        case SessionError::CANCELLED:         return "cancelled";
        default:                              return "unknown";
    }
}

SessionConfig defaultSessionConfig() {
    SessionConfig config;
    config.port = DEVICE_TCP_PORT;
    config.connectTimeoutMs = SESSION_CONNECT_TIMEOUT_MS;
    config.responseTimeoutMs = SESSION_RESPONSE_TIMEOUT_MS;
    config.queryAttempts = SESSION_QUERY_ATTEMPTS;
    return config;
}

Device::Device()
    : softwareVersion("Unknown"), port(0), available(false), identified(false) {}

DeviceSession::DeviceSession(const Catalog* catalog, const SessionConfig& config)
    : _catalog(catalog), _config(config),
      _state(SessionState::DISCONNECTED), _lastError(SessionError::NONE),
      _hasConnected(false) {
    _stats.requestsSent = 0;
    _stats.responsesMatched = 0;
    _stats.staleResponses = 0;
    _stats.reconnects = 0;
    if (_config.queryAttempts < 1) {
        _config.queryAttempts = 1;
    }
}

DeviceSession::~DeviceSession() {
    std::lock_guard<std::mutex> io(_ioMutex);
    _socket.disconnect();
}

SessionError DeviceSession::connect(const std::string& host, const CancelFlag* cancel) {
    std::lock_guard<std::mutex> io(_ioMutex);

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _targetHost = host;
        _state = SessionState::CONNECTING;
        _device.available = false;
    }

    _socket.disconnect();
    LOG_INFO("SESSION", "Connecting to %s:%u", host.c_str(), _config.port);

    IoStatus status = _socket.connect(host.c_str(), _config.port,
                                      _config.connectTimeoutMs, cancel);
    if (status != IoStatus::OK) {
        SessionError err = SessionError::IO_FAILURE;
        if (status == IoStatus::TIMEOUT) err = SessionError::TIMEOUT;
        if (status == IoStatus::CANCELLED) err = SessionError::CANCELLED;
        LOG_ERROR("SESSION", "Connect to %s failed: %s", host.c_str(), ioStatusToString(status));
        closeLocked(err);
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _device.host = host;
        _device.port = _config.port;
    }

    SessionError err = identify(cancel);
    if (err != SessionError::NONE) {
        LOG_ERROR("SESSION", "INFO exchange with %s failed: %s",
                  host.c_str(), sessionErrorToString(err));
        closeLocked(err);
        return err;
    }

    std::lock_guard<std::mutex> lock(_stateMutex);
    _state = SessionState::CONNECTED;
    _device.available = true;
    _lastError = SessionError::NONE;
    if (_hasConnected) {
        _stats.reconnects++;
    }
    _hasConnected = true;

    LOG_INFO("SESSION", "Connected to %s (id=%s, model=%s, type=%s)",
             host.c_str(),
             _device.id.empty() ? "?" : _device.id.c_str(),
             _device.modelName.empty() ? "?" : _device.modelName.c_str(),
             _device.typeCode.empty() ? "?" : _device.typeCode.c_str());
    return SessionError::NONE;
}

SessionError DeviceSession::reconnect(const CancelFlag* cancel) {
    std::string host = targetHost();
    if (host.empty()) {
        LOG_ERROR("SESSION", "Cannot reconnect: no previous connection");
        return SessionError::NOT_CONNECTED;
    }
    return connect(host, cancel);
}

void DeviceSession::disconnect() {
    std::lock_guard<std::mutex> io(_ioMutex);
    bool wasOpen = _socket.isConnected();
    closeLocked(SessionError::NONE);
    if (wasOpen) {
        LOG_INFO("SESSION", "Disconnected from %s", targetHost().c_str());
    }
}

SessionError DeviceSession::query(DatapointMap& out) {
    out.clear();

    std::lock_guard<std::mutex> io(_ioMutex);
    if (!_socket.isConnected()) {
        return SessionError::NOT_CONNECTED;
    }

    JsonDocument response;
    SessionError err = exchange(Command::QUERY, DatapointMap(), response, nullptr);
    if (err == SessionError::IO_FAILURE || err == SessionError::TIMEOUT ||
        err == SessionError::PROTOCOL_MISMATCH) {
        // The reconciler reopens the connection on its next pass
        closeLocked(err);
        return err;
    }
    if (err != SessionError::NONE) {
        markResult(err, false);
        return err;
    }

    int dropped = 0;
    JsonObjectConst msg = response["msg"];
    if (!parseQueryData(msg, out, dropped)) {
        LOG_ERROR("SESSION", "QUERY reply from %s has no data", _socket.host().c_str());
        markResult(SessionError::PROTOCOL_MISMATCH, false);
        return SessionError::PROTOCOL_MISMATCH;
    }
    if (dropped > 0) {
        LOG_INFO("SESSION", "Dropped %d invalid datapoint(s) from %s", dropped, _socket.host().c_str());
    }

    markResult(SessionError::NONE, true);
    return SessionError::NONE;
}

SessionError DeviceSession::control(const DatapointMap& payload) {
    int badId = 0;
    if (!validateDatapoints(payload, badId)) {
        LOG_ERROR("SESSION", "Rejected control payload (datapoint %d)", badId);
        return SessionError::INVALID_PAYLOAD;
    }

    std::lock_guard<std::mutex> io(_ioMutex);
    if (!_socket.isConnected()) {
        return SessionError::NOT_CONNECTED;
    }

    std::string frame;
    if (!encodeRequest((int)Command::SET, _sequence.next(), payload, frame)) {
        return SessionError::INVALID_COMMAND;
    }

    LOG_TRACE("SESSION", "TX %s", frame.c_str());
    IoStatus status = _socket.sendString(frame, _config.responseTimeoutMs);
    if (status != IoStatus::OK) {
        LOG_ERROR("SESSION", "SET to %s failed: %s", _socket.host().c_str(), ioStatusToString(status));
        closeLocked(SessionError::IO_FAILURE);
        return SessionError::IO_FAILURE;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _stats.requestsSent++;
    }
    markResult(SessionError::NONE, true);
    return SessionError::NONE;
}

SessionError DeviceSession::exchange(Command cmd, const DatapointMap& payload,
                                     JsonDocument& response, const CancelFlag* cancel) {
    if (!_socket.isConnected()) {
        return SessionError::NOT_CONNECTED;
    }

    std::string sn = _sequence.next();
    std::string frame;
    if (!encodeRequest((int)cmd, sn, payload, frame)) {
        return SessionError::INVALID_COMMAND;
    }

    LOG_TRACE("SESSION", "TX %s", frame.c_str());
    IoStatus status = _socket.sendString(frame, _config.responseTimeoutMs);
    if (status != IoStatus::OK) {
        LOG_ERROR("SESSION", "%s to %s failed: %s", commandToString((int)cmd),
                  _socket.host().c_str(), ioStatusToString(status));
        return SessionError::IO_FAILURE;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _stats.requestsSent++;
    }

    // An attempt is one responseTimeoutMs window. Stale or malformed lines are
    // dropped and the wait continues within the same window.
    bool sawStale = false;
    for (int attempt = 1; attempt <= _config.queryAttempts; attempt++) {
        unsigned long attemptStart = millis();
        while (true) {
            if (isCancelled(cancel)) {
                return SessionError::CANCELLED;
            }

            unsigned long left = remainingMs(attemptStart, _config.responseTimeoutMs, millis());
            if (left == 0) {
                LOG_DEBUG("SESSION", "Timeout on attempt %d/%d waiting for %s sn=%s",
                          attempt, _config.queryAttempts, commandToString((int)cmd), sn.c_str());
                break;
            }
            if (cancel != nullptr && left > CANCEL_POLL_SLICE_MS) {
                left = CANCEL_POLL_SLICE_MS;
            }

            std::string line;
            status = _socket.receiveLine(line, left);
            if (status == IoStatus::TIMEOUT) {
                continue;
            }
            if (status != IoStatus::OK) {
                LOG_ERROR("SESSION", "Read from %s failed: %s",
                          _socket.host().c_str(), ioStatusToString(status));
                return SessionError::IO_FAILURE;
            }

            if (!decodeFrame(line.data(), line.size(), response) ||
                !responseMatches(response, sn)) {
                LOG_DEBUG("SESSION", "Dropping stale or malformed reply (waiting for sn=%s)", sn.c_str());
                sawStale = true;
                std::lock_guard<std::mutex> lock(_stateMutex);
                _stats.staleResponses++;
                continue;
            }

            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.responsesMatched++;
            return SessionError::NONE;
        }
    }

    LOG_ERROR("SESSION", "No valid %s response from %s after %d attempt(s)",
              commandToString((int)cmd), _socket.host().c_str(), _config.queryAttempts);
    return sawStale ? SessionError::PROTOCOL_MISMATCH : SessionError::TIMEOUT;
}

SessionError DeviceSession::identify(const CancelFlag* cancel) {
    JsonDocument response;
    SessionError err = exchange(Command::INFO, DatapointMap(), response, cancel);
    if (err != SessionError::NONE) {
        return err;
    }

    InfoReply info;
    JsonObjectConst msg = response["msg"];
    if (!parseInfoReply(msg, info)) {
        LOG_ERROR("SESSION", "INFO reply from %s is missing did or pid; device left unidentified",
                  _socket.host().c_str());
        return SessionError::NONE;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (!_device.id.empty() && _device.id != info.did) {
            LOG_ERROR("SESSION", "Device at %s reports id %s, expected %s",
                      _socket.host().c_str(), info.did.c_str(), _device.id.c_str());
            return SessionError::PROTOCOL_MISMATCH;
        }
    }

    char rssi[16] = "?";
    if (info.hasRssi) {
        snprintf(rssi, sizeof(rssi), "%d", info.rssi);
    }
    LOG_INFO("SESSION", "INFO %s: pid=%s dtp=%s mac=%s ip=%s rssi=%s sv=%s hv=%s",
             info.did.c_str(), info.pid.c_str(), info.dtp.c_str(), info.mac.c_str(),
             info.ip.c_str(), rssi, info.sv.c_str(), info.hv.c_str());

    applyInfo(info);
    return SessionError::NONE;
}

void DeviceSession::applyInfo(const InfoReply& info) {
    ModelInfo model;
    bool found = _catalog != nullptr && _catalog->lookup(info.pid, model);
    if (!found) {
        LOG_ERROR("SESSION", "No catalog entry for product %s (device %s)",
                  info.pid.c_str(), info.did.c_str());
    }

    std::lock_guard<std::mutex> lock(_stateMutex);
    _device.id = info.did;
    _device.productId = info.pid;
    _device.softwareVersion = info.sv;
    _device.identified = true;
    _device.typeCode = model.typeCode;
    _device.modelName = model.modelName;
    _device.icon = model.icon;
    _device.datapointIds = model.datapointIds;
}

void DeviceSession::closeLocked(SessionError reason) {
    _socket.disconnect();

    std::lock_guard<std::mutex> lock(_stateMutex);
    _state = SessionState::DISCONNECTED;
    _device.available = false;
    _device.host.clear();
    _device.port = 0;
    if (reason != SessionError::NONE) {
        _lastError = reason;
    }
}

void DeviceSession::markResult(SessionError error, bool available) {
    std::lock_guard<std::mutex> lock(_stateMutex);
    _lastError = error;
    _device.available = available;
}

Device DeviceSession::device() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _device;
}

std::string DeviceSession::id() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _device.id;
}

std::string DeviceSession::typeCode() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _device.typeCode;
}

std::string DeviceSession::targetHost() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _targetHost;
}

bool DeviceSession::isAvailable() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _device.available;
}

bool DeviceSession::isIdentified() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _device.identified;
}

SessionState DeviceSession::state() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _state;
}

SessionError DeviceSession::lastError() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _lastError;
}

SessionStats DeviceSession::stats() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _stats;
}

} // namespace cozyhub

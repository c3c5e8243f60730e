#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../devices/device_session.h"

namespace cozyhub {

typedef std::shared_ptr<DeviceSession> SessionPtr;

// Device id -> session. Written by the reconciler, read from any thread.
// Handles returned to readers stay valid after the entry is removed.
class DeviceRegistry {
public:
    DeviceRegistry();

    // Register under session->id(). Returns false (and changes nothing) if
    // the id is empty or already registered.
    bool add(const SessionPtr& session);

    // Returns the removed session, or nullptr if id was not registered
    SessionPtr remove(const std::string& id);

    // Swap the session registered under id. Returns false if id is unknown
    // or the new session reports a different id.
    bool replace(const std::string& id, const SessionPtr& session);

    SessionPtr get(const std::string& id) const;
    std::vector<SessionPtr> getByType(const std::string& typeCode) const;

    // All sessions, ordered by id
    std::vector<SessionPtr> all() const;

    bool contains(const std::string& id) const;
    int count() const;
    void clear();

private:
    mutable std::mutex _mutex;
    std::map<std::string, SessionPtr> _sessions;
};

} // namespace cozyhub

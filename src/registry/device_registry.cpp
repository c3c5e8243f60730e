#include "device_registry.h"
#include "../debug_log.h"

namespace cozyhub {

DeviceRegistry::DeviceRegistry() {}

bool DeviceRegistry::add(const SessionPtr& session) {
    if (!session) return false;
    std::string id = session->id();
    if (id.empty()) return false;

    std::lock_guard<std::mutex> lock(_mutex);
    if (_sessions.find(id) != _sessions.end()) {
        return false;
    }
    _sessions[id] = session;
    LOG_DEBUG("REGISTRY", "Added %s (%zu registered)", id.c_str(), _sessions.size());
    return true;
}

SessionPtr DeviceRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, SessionPtr>::iterator it = _sessions.find(id);
    if (it == _sessions.end()) {
        return SessionPtr();
    }
    SessionPtr removed = it->second;
    _sessions.erase(it);
    LOG_DEBUG("REGISTRY", "Removed %s (%zu registered)", id.c_str(), _sessions.size());
    return removed;
}

bool DeviceRegistry::replace(const std::string& id, const SessionPtr& session) {
    if (!session || session->id() != id) return false;

    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, SessionPtr>::iterator it = _sessions.find(id);
    if (it == _sessions.end()) {
        return false;
    }
    it->second = session;
    return true;
}

SessionPtr DeviceRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::map<std::string, SessionPtr>::const_iterator it = _sessions.find(id);
    if (it == _sessions.end()) {
        return SessionPtr();
    }
    return it->second;
}

std::vector<SessionPtr> DeviceRegistry::getByType(const std::string& typeCode) const {
    std::vector<SessionPtr> matches;
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::map<std::string, SessionPtr>::const_iterator it = _sessions.begin();
         it != _sessions.end(); ++it) {
        if (it->second->typeCode() == typeCode) {
            matches.push_back(it->second);
        }
    }
    return matches;
}

std::vector<SessionPtr> DeviceRegistry::all() const {
    std::vector<SessionPtr> sessions;
    std::lock_guard<std::mutex> lock(_mutex);
    sessions.reserve(_sessions.size());
    for (std::map<std::string, SessionPtr>::const_iterator it = _sessions.begin();
         it != _sessions.end(); ++it) {
        sessions.push_back(it->second);
    }
    return sessions;
}

bool DeviceRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _sessions.find(id) != _sessions.end();
}

int DeviceRegistry::count() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (int)_sessions.size();
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _sessions.clear();
}

} // namespace cozyhub

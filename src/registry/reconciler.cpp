#include "reconciler.h"
#include <chrono>
#include <exception>
#include <memory>
#include <system_error>
#include <vector>
#include "../debug_log.h"

namespace cozyhub {

AddressDiff diffAddresses(const AddressSet& previous, const AddressSet& current) {
    AddressDiff diff;
    for (AddressSet::const_iterator it = current.begin(); it != current.end(); ++it) {
        if (previous.find(*it) == previous.end()) {
            diff.added.insert(*it);
        }
    }
    for (AddressSet::const_iterator it = previous.begin(); it != previous.end(); ++it) {
        if (current.find(*it) == current.end()) {
            diff.gone.insert(*it);
        }
    }
    return diff;
}

Reconciler::Reconciler(HubContext& context, AddressSource& source)
    : _context(context), _source(source), _running(false), _cancel(false) {
    _stats = ReconcileStats();
}

Reconciler::~Reconciler() {
    stop();
}

void Reconciler::runInitial() {
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _previous.clear();
    }
    LOG_INFO("RECON", "Initial discovery");
    tick();
}

bool Reconciler::start() {
    if (_running.load()) return false;

    _cancel.store(false);
    _running.store(true);
    try {
        _thread = std::thread(&Reconciler::run, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("RECON", "Cannot start reconciliation thread: %s", e.what());
        _running.store(false);
        return false;
    }
    LOG_INFO("RECON", "Reconciling every %d s", _context.config.scanIntervalS);
    return true;
}

void Reconciler::stop() {
    {
        std::lock_guard<std::mutex> lock(_waitMutex);
        _cancel.store(true);
    }
    _wake.notify_all();

    if (_thread.joinable()) {
        _thread.join();
    }
    _running.store(false);
    shutdownSessions();
}

void Reconciler::run() {
    std::chrono::seconds interval(clampScanInterval(_context.config.scanIntervalS));

    while (true) {
        {
            std::unique_lock<std::mutex> lock(_waitMutex);
            if (_wake.wait_for(lock, interval, [this] { return _cancel.load(); })) {
                break;
            }
        }

        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("RECON", "Tick failed: %s", e.what());
            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.tickFailures++;
        }
    }
    LOG_INFO("RECON", "Reconciliation stopped");
}

void Reconciler::tick() {
    AddressSet current = collectAddresses();
    if (isCancelled(&_cancel)) return;

    AddressDiff diff = diffAddresses(previous(), current);
    LOG_INFO("RECON", "%zu address(es): %zu new, %zu gone",
             current.size(), diff.added.size(), diff.gone.size());

    AddressSet failed;
    connectNew(diff.added, diff.gone, failed);
    removeGone(diff.gone);
    reconnectUnavailable();

    // Failed addresses stay out of previous so the next tick retries them
    AddressSet next;
    for (AddressSet::const_iterator it = current.begin(); it != current.end(); ++it) {
        if (failed.find(*it) == failed.end()) {
            next.insert(*it);
        }
    }

    std::lock_guard<std::mutex> lock(_stateMutex);
    _previous.swap(next);
    _stats.ticks++;
}

AddressSet Reconciler::collectAddresses() {
    AddressSet current = _source.discover(&_cancel);
    const std::vector<std::string>& statics = _context.config.staticAddresses;
    current.insert(statics.begin(), statics.end());
    return current;
}

void Reconciler::connectNew(const AddressSet& added, const AddressSet& gone,
                            AddressSet& failed) {
    // Everything counts as failed until its session is fully set up
    failed = added;

    for (AddressSet::const_iterator it = added.begin(); it != added.end(); ++it) {
        if (isCancelled(&_cancel)) return;

        const std::string& host = *it;
        SessionPtr session = std::make_shared<DeviceSession>(_context.catalog,
                                                             _context.config.session);
        SessionError err = session->connect(host, &_cancel);
        if (err != SessionError::NONE) {
            LOG_ERROR("RECON", "Device at %s not added: %s", host.c_str(), sessionErrorToString(err));
            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.connectFailures++;
            continue;
        }
        if (!session->isIdentified()) {
            LOG_ERROR("RECON", "Device at %s did not identify itself, retrying next tick", host.c_str());
            session->disconnect();
            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.connectFailures++;
            continue;
        }
        if (isCancelled(&_cancel)) {
            session->disconnect();
            return;
        }

        std::string id = session->id();
        SessionPtr existing = _context.registry.get(id);
        if (!existing) {
            _context.registry.add(session);
            LOG_INFO("RECON", "Registered %s at %s", id.c_str(), host.c_str());
            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.devicesAdded++;
        } else if (!existing->isAvailable() ||
                   gone.find(existing->targetHost()) != gone.end()) {
            LOG_INFO("RECON", "%s moved from %s to %s", id.c_str(),
                     existing->targetHost().c_str(), host.c_str());
            existing->disconnect();
            _context.registry.replace(id, session);
            std::lock_guard<std::mutex> lock(_stateMutex);
            _stats.devicesReplaced++;
        } else {
            LOG_INFO("RECON", "%s at %s is already registered at %s", id.c_str(),
                     host.c_str(), existing->targetHost().c_str());
            session->disconnect();
        }
        failed.erase(host);
    }
}

void Reconciler::removeGone(const AddressSet& gone) {
    if (gone.empty()) return;

    std::vector<SessionPtr> sessions = _context.registry.all();
    for (size_t i = 0; i < sessions.size(); i++) {
        std::string host = sessions[i]->targetHost();
        if (gone.find(host) == gone.end()) continue;

        std::string id = sessions[i]->id();
        sessions[i]->disconnect();
        _context.registry.remove(id);
        LOG_INFO("RECON", "Removed %s, %s no longer answers discovery", id.c_str(), host.c_str());

        std::lock_guard<std::mutex> lock(_stateMutex);
        _stats.devicesRemoved++;
    }
}

void Reconciler::reconnectUnavailable() {
    std::vector<SessionPtr> sessions = _context.registry.all();
    for (size_t i = 0; i < sessions.size(); i++) {
        if (isCancelled(&_cancel)) return;
        if (sessions[i]->isAvailable()) continue;

        SessionError err = sessions[i]->reconnect(&_cancel);
        bool ok = err == SessionError::NONE && sessions[i]->isIdentified();
        if (!ok) {
            LOG_ERROR("RECON", "Reconnect to %s failed: %s",
                      sessions[i]->id().c_str(), sessionErrorToString(err));
        }

        std::lock_guard<std::mutex> lock(_stateMutex);
        _stats.reconnectAttempts++;
        if (ok) _stats.reconnectSuccesses++;
    }
}

void Reconciler::shutdownSessions() {
    std::vector<SessionPtr> sessions = _context.registry.all();
    for (size_t i = 0; i < sessions.size(); i++) {
        sessions[i]->disconnect();
    }
    _context.registry.clear();
    if (!sessions.empty()) {
        LOG_INFO("RECON", "Closed %zu session(s)", sessions.size());
    }
}

AddressSet Reconciler::previous() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _previous;
}

ReconcileStats Reconciler::stats() const {
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _stats;
}

} // namespace cozyhub

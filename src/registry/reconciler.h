#pragma once
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "hub_context.h"
#include "../clock.h"
#include "../discovery/discovery.h"

namespace cozyhub {

struct AddressDiff {
    AddressSet added;  // in current, not in previous
    AddressSet gone;   // in previous, not in current
};

AddressDiff diffAddresses(const AddressSet& previous, const AddressSet& current);

struct ReconcileStats {
    int ticks;
    int tickFailures;        // ticks aborted by an exception
    int devicesAdded;
    int devicesReplaced;
    int devicesRemoved;
    int connectFailures;
    int reconnectAttempts;
    int reconnectSuccesses;
};

// Keeps the registry in line with what discovery finds on the network.
// tick() may be driven directly; start() runs it every scan interval on a
// background thread until stop().
class Reconciler {
public:
    Reconciler(HubContext& context, AddressSource& source);
    ~Reconciler();

    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    // First discovery at startup; seeds the previous address set
    void runInitial();

    // One reconciliation pass
    void tick();

    // Background loop; the first tick runs one interval after start
    bool start();

    // Cancel any in-flight step, join the thread, disconnect every session
    // and clear the registry. Safe to call more than once.
    void stop();

    // Cancel any in-flight step without joining or touching the registry.
    // A single atomic store, so it may be called from a signal handler.
    void requestStop() { _cancel.store(true); }

    bool isRunning() const { return _running.load(); }

    AddressSet previous() const;
    ReconcileStats stats() const;

private:
    HubContext& _context;
    AddressSource& _source;

    std::thread _thread;
    std::atomic<bool> _running;
    CancelFlag _cancel;
    std::mutex _waitMutex;
    std::condition_variable _wake;

    mutable std::mutex _stateMutex;
    AddressSet _previous;
    ReconcileStats _stats;

    void run();
    AddressSet collectAddresses();
    void connectNew(const AddressSet& added, const AddressSet& gone, AddressSet& failed);
    void removeGone(const AddressSet& gone);
    void reconnectUnavailable();
    void shutdownSessions();
};

} // namespace cozyhub

#pragma once
#include <atomic>
#include <cstdint>

namespace cozyhub {

// Set from another thread to abort a long-running wait (scan, connect,
// reconciliation tick). Waits poll it in short slices.
typedef std::atomic<bool> CancelFlag;

// Granularity of cancellable waits
static const unsigned long CANCEL_POLL_SLICE_MS = 50;

// Monotonic milliseconds since process start
unsigned long millis();

// Wall-clock milliseconds since the Unix epoch
uint64_t epochMillis();

void delayMs(unsigned long ms);

// Milliseconds left until deadline (0 once passed); handles wrap-around
unsigned long remainingMs(unsigned long startMs, unsigned long timeoutMs, unsigned long nowMs);

inline bool isCancelled(const CancelFlag* cancel) {
    return cancel != nullptr && cancel->load();
}

} // namespace cozyhub

#include "clock.h"
#include <chrono>
#include <thread>

namespace cozyhub {

static const std::chrono::steady_clock::time_point START = std::chrono::steady_clock::now();

unsigned long millis() {
    return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - START).count();
}

uint64_t epochMillis() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void delayMs(unsigned long ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

unsigned long remainingMs(unsigned long startMs, unsigned long timeoutMs, unsigned long nowMs) {
    unsigned long elapsed = nowMs - startMs;
    if (elapsed >= timeoutMs) return 0;
    return timeoutMs - elapsed;
}

} // namespace cozyhub

#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>

// ESP-IDF task watchdog (TWDT) helpers for the polling task
namespace Watchdog {
    // Apply timeout_ms to the TWDT, starting it if sdkconfig did not
    void init(uint32_t timeout_ms);
    // Add the calling task; false if the TWDT refused it
    bool subscribe();
    void feed();
    // Remove the calling task before it exits
    void unsubscribe();
}

#endif // WATCHDOG_HPP

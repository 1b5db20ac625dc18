#ifndef MONITOR_ERROR_HPP
#define MONITOR_ERROR_HPP

#include <cstdint>

// Failure kinds surfaced by the poll loop. The numeric value doubles as the
// exit code reported when the loop stops (0 = clean stop).
enum class MonitorError : uint8_t {
    NONE                  = 0,
    HARDWARE_UNAVAILABLE  = 1,
    NETWORK_UNAVAILABLE   = 2,
    CONFIGURATION_MISSING = 3
};

inline const char* monitorErrorName(MonitorError err) {
    switch (err) {
        case MonitorError::NONE:                  return "none";
        case MonitorError::HARDWARE_UNAVAILABLE:  return "hardware unavailable";
        case MonitorError::NETWORK_UNAVAILABLE:   return "network unavailable";
        case MonitorError::CONFIGURATION_MISSING: return "configuration missing";
    }
    return "unknown";
}

inline int exitCodeFor(MonitorError err) {
    return static_cast<int>(err);
}

#endif // MONITOR_ERROR_HPP

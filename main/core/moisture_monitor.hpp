#ifndef MOISTURE_MONITOR_HPP
#define MOISTURE_MONITOR_HPP

#include <cstdint>
#include <main/core/notifier.hpp>
#include <main/hardware/moisture_source.hpp>
#include <main/models/monitor_error.hpp>
#include <main/models/monitor_settings.hpp>
#include <main/models/soil_state.hpp>

// Everything one polling loop carries between iterations
struct MonitorContext {
    MonitorContext(MoistureSource& source, Notifier& notifier, const MonitorSettings& settings);

    MoistureSource& source;
    Notifier&       notifier;
    MonitorSettings settings;

    bool      has_state;     // false until the first successful read
    SoilState last_state;
    bool      has_reading;
    uint16_t  last_raw;
    uint32_t  last_read_ms;  // now_ms of the last successful read

    uint32_t  gain_count;
    uint32_t  loss_count;
    uint32_t  poll_count;

    // Latched on the first failure; the loop stops producing notifications
    MonitorError fault;
};

namespace MoistureMonitor {
    // One READ -> EVALUATE -> NOTIFY-IF-DRY pass. Once ctx.fault is set,
    // returns it without touching the hardware.
    MonitorError pollOnce(MonitorContext& ctx, uint32_t now_ms, const char* timestamp);

    // True if a DRY evaluation should produce a mail under the context's policy
    bool shouldNotify(const MonitorContext& ctx, SoilState next);
}

#endif // MOISTURE_MONITOR_HPP

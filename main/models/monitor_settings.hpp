#ifndef MONITOR_SETTINGS_HPP
#define MONITOR_SETTINGS_HPP

#include <cstdint>
#include <main/models/soil_state.hpp>

// Per-sensor polling parameters
struct MonitorSettings {
    uint16_t       dry_threshold;   // raw ADC boundary between WET and DRY
    SensorPolarity polarity;
    NotifyPolicy   notify_policy;
    uint32_t       period_ms;       // poll interval
};

#endif // MONITOR_SETTINGS_HPP

#ifndef RUNTIME_SETTINGS_HPP
#define RUNTIME_SETTINGS_HPP

#include <cstdint>
#include <main/models/monitor_settings.hpp>

// Deployment settings kept in NVS namespace "moisture" (provision with
// nvs_settings.csv). Missing keys fall back to Config defaults, which are
// written back on first boot.
namespace RuntimeSettings {
    // Load from NVS or use defaults. NVS flash must already be initialized.
    void init();

    MonitorSettings monitor();
    uint8_t adcChannel();
}

#endif // RUNTIME_SETTINGS_HPP

#ifndef SETTINGS_CHECK_HPP
#define SETTINGS_CHECK_HPP

#include <cstdint>
#include <main/models/mail_settings.hpp>
#include <main/models/monitor_error.hpp>
#include <main/models/monitor_settings.hpp>

// Startup validation; each failure is logged and reported as CONFIGURATION_MISSING
namespace SettingsCheck {
    MonitorError checkMonitor(const MonitorSettings& settings, uint16_t max_raw);
    MonitorError checkChannel(uint8_t channel, uint8_t channel_count);
    MonitorError checkMail(const MailSettings& settings);
}

#endif // SETTINGS_CHECK_HPP

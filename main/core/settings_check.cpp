#include <main/core/settings_check.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "SETTINGS";

namespace {
    static bool isBlank(const char* s) {
        return s == nullptr || s[0] == '\0';
    }

    static MonitorError missing(const char* what) {
        LOG_ERROR(TAG, "Missing or invalid setting: %s", what);
        return MonitorError::CONFIGURATION_MISSING;
    }
}

namespace SettingsCheck {
    MonitorError checkMonitor(const MonitorSettings& settings, uint16_t max_raw) {
        // The threshold must leave at least one reading on the DRY side
        const bool low_is_dry = settings.polarity == SensorPolarity::LOW_IS_DRY;
        const uint16_t lowest = low_is_dry ? 1 : 0;
        const uint16_t highest = low_is_dry ? max_raw : static_cast<uint16_t>(max_raw - 1);
        if (settings.dry_threshold < lowest || settings.dry_threshold > highest) {
            return missing("dry threshold");
        }
        if (settings.period_ms == 0) {
            return missing("poll interval");
        }
        if (settings.polarity != SensorPolarity::LOW_IS_DRY &&
            settings.polarity != SensorPolarity::HIGH_IS_DRY) {
            return missing("sensor polarity");
        }
        if (settings.notify_policy != NotifyPolicy::ON_TRANSITION &&
            settings.notify_policy != NotifyPolicy::EVERY_DRY_READING) {
            return missing("notify policy");
        }
        return MonitorError::NONE;
    }

    MonitorError checkChannel(uint8_t channel, uint8_t channel_count) {
        if (channel >= channel_count) {
            return missing("ADC channel");
        }
        return MonitorError::NONE;
    }

    MonitorError checkMail(const MailSettings& settings) {
        if (isBlank(settings.host))     return missing("SMTP host");
        if (settings.port <= 0 || settings.port > 65535) return missing("SMTP port");
        if (isBlank(settings.username)) return missing("SMTP user");
        if (isBlank(settings.password)) return missing("SMTP password");
        if (isBlank(settings.from))     return missing("mail sender");
        if (isBlank(settings.to))       return missing("mail recipient");
        if (isBlank(settings.subject_template)) return missing("subject template");
        if (isBlank(settings.body_template))    return missing("body template");
        if (settings.timeout_ms == 0)   return missing("mail timeout");
        return MonitorError::NONE;
    }
}

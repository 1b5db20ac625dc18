#include <main/state/runtime_settings.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>

static const char* TAG = "RUNTIME_SET";
static const char* NVS_NAMESPACE = "moisture";

namespace {
    static constexpr const char* KEY_THRESHOLD = "threshold";
    static constexpr const char* KEY_POLARITY  = "polarity";
    static constexpr const char* KEY_POLICY    = "policy";
    static constexpr const char* KEY_POLL_MS   = "poll_ms";
    static constexpr const char* KEY_CHANNEL   = "channel";

    struct SettingsData {
        uint16_t dry_threshold;
        uint8_t  polarity;
        uint8_t  notify_policy;
        uint32_t period_ms;
        uint8_t  channel;
    };

    static SettingsData s_data;
    static bool s_initialized = false;

    static void loadDefaults() {
        s_data.dry_threshold = Config::Monitoring::dry_threshold;
        s_data.polarity = static_cast<uint8_t>(Config::Monitoring::polarity);
        s_data.notify_policy = static_cast<uint8_t>(Config::Monitoring::notify_policy);
        s_data.period_ms = Config::Tasks::Poll::period_ms;
        s_data.channel = Config::Hardware::Adc::default_channel;
    }

    // Returns the number of keys found; missing keys keep their defaults
    static int loadFromNvs() {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            return 0;
        }
        int found = 0;
        if (nvs_get_u16(handle, KEY_THRESHOLD, &s_data.dry_threshold) == ESP_OK) ++found;
        if (nvs_get_u8(handle, KEY_POLARITY, &s_data.polarity) == ESP_OK) ++found;
        if (nvs_get_u8(handle, KEY_POLICY, &s_data.notify_policy) == ESP_OK) ++found;
        if (nvs_get_u32(handle, KEY_POLL_MS, &s_data.period_ms) == ESP_OK) ++found;
        if (nvs_get_u8(handle, KEY_CHANNEL, &s_data.channel) == ESP_OK) ++found;
        nvs_close(handle);
        return found;
    }

    static bool saveToNvs() {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS open failed: %d", static_cast<int>(err));
            return false;
        }

        err = nvs_set_u16(handle, KEY_THRESHOLD, s_data.dry_threshold);
        if (err == ESP_OK) err = nvs_set_u8(handle, KEY_POLARITY, s_data.polarity);
        if (err == ESP_OK) err = nvs_set_u8(handle, KEY_POLICY, s_data.notify_policy);
        if (err == ESP_OK) err = nvs_set_u32(handle, KEY_POLL_MS, s_data.period_ms);
        if (err == ESP_OK) err = nvs_set_u8(handle, KEY_CHANNEL, s_data.channel);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS set failed: %d", static_cast<int>(err));
            nvs_close(handle);
            return false;
        }

        err = nvs_commit(handle);
        nvs_close(handle);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "NVS commit failed: %d", static_cast<int>(err));
            return false;
        }
        return true;
    }
}

namespace RuntimeSettings {
    void init() {
        if (s_initialized) {
            return;
        }

        loadDefaults();

        int found = loadFromNvs();
        if (found == 5) {
            LOG_INFO(TAG, "%s", "Loaded settings from NVS");
        } else {
            LOG_INFO(TAG, "Using defaults for %d missing setting(s)", 5 - found);
            // Persist the merged set so the next boot reads it back whole
            (void)saveToNvs();
        }

        LOG_INFO(TAG, "threshold=%u polarity=%s policy=%s poll=%lu ms channel=%u",
                 static_cast<unsigned>(s_data.dry_threshold),
                 polarityName(static_cast<SensorPolarity>(s_data.polarity)),
                 notifyPolicyName(static_cast<NotifyPolicy>(s_data.notify_policy)),
                 static_cast<unsigned long>(s_data.period_ms),
                 static_cast<unsigned>(s_data.channel));
        s_initialized = true;
    }

    MonitorSettings monitor() {
        MonitorSettings out{};
        out.dry_threshold = s_data.dry_threshold;
        out.polarity = static_cast<SensorPolarity>(s_data.polarity);
        out.notify_policy = static_cast<NotifyPolicy>(s_data.notify_policy);
        out.period_ms = s_data.period_ms;
        return out;
    }

    uint8_t adcChannel() {
        return s_data.channel;
    }
}

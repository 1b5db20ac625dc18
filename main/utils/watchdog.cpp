#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <esp_err.h>
#include <esp_task_wdt.h>

namespace {
    static const char* TAG = "WATCHDOG";
    static bool s_feed_failed = false;
}

namespace Watchdog {
    void init(uint32_t timeout_ms) {
        const esp_task_wdt_config_t config = {
            .timeout_ms = timeout_ms,
            .idle_core_mask = 0,
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            err = esp_task_wdt_init(&config);
        }
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "TWDT setup failed: %s", esp_err_to_name(err));
            return;
        }
        LOG_INFO(TAG, "TWDT armed, %lu ms", static_cast<unsigned long>(timeout_ms));
    }

    bool subscribe() {
        const esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "Task not watched: %s", esp_err_to_name(err));
            return false;
        }
        return true;
    }

    void feed() {
        const esp_err_t err = esp_task_wdt_reset();
        if (err != ESP_OK && !s_feed_failed) {
            // Report once; a failing reset repeats every cycle
            LOG_WARN(TAG, "Reset rejected: %s", esp_err_to_name(err));
            s_feed_failed = true;
        }
    }

    void unsubscribe() {
        const esp_err_t err = esp_task_wdt_delete(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "Task removal failed: %s", esp_err_to_name(err));
        }
    }
}

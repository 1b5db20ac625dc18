#include <main/utils/time_sync.hpp>
#include <main/utils/logger.hpp>
#include <ctime>
#include <cstdio>
#include <esp_sntp.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";

    // 2026-01-01 00:00:00 UTC; an RTC reading before this was never set
    constexpr time_t MIN_VALID_EPOCH = 1767225600;

    static bool s_started = false;
    static volatile bool s_notified = false;

    static void onSynced(struct timeval* tv) {
        (void)tv;
        s_notified = true;
        LOG_INFO(TAG, "%s", "Clock set from SNTP");
    }

    // Writes the current UTC time with fmt; false if the clock is unset
    static bool formatUtc(const char* fmt, char* out, std::size_t out_size) {
        if (!TimeSync::isSynced()) {
            return false;
        }
        const time_t now = time(nullptr);
        struct tm utc;
        gmtime_r(&now, &utc);
        return strftime(out, out_size, fmt, &utc) != 0;
    }
}

namespace TimeSync {
    void init() {
        if (s_started) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, "pool.ntp.org");
        esp_sntp_setservername(1, "time.google.com");
        esp_sntp_set_time_sync_notification_cb(&onSynced);
        esp_sntp_init();
        s_started = true;
    }

    bool isSynced() {
        return s_notified || time(nullptr) >= MIN_VALID_EPOCH;
    }

    bool waitForSync(unsigned int timeout_ms) {
        init();
        const TickType_t start = xTaskGetTickCount();
        const TickType_t budget = pdMS_TO_TICKS(timeout_ms);
        while (!isSynced()) {
            if (xTaskGetTickCount() - start >= budget) {
                LOG_WARN(TAG, "No SNTP answer in %u ms; timestamps fall back to uptime", timeout_ms);
                return false;
            }
            vTaskDelay(pdMS_TO_TICKS(200));
        }
        return true;
    }

    bool formatTimestamp(char* out, std::size_t out_size) {
        if (out_size == 0) {
            return false;
        }
        if (formatUtc("%Y-%m-%d %H:%M:%S UTC", out, out_size)) {
            return true;
        }
        snprintf(out, out_size, "uptime %llds",
                 static_cast<long long>(esp_timer_get_time() / 1000000LL));
        return false;
    }

    bool formatRfc2822Date(char* out, std::size_t out_size) {
        if (out_size == 0) {
            return false;
        }
        // %a and %b come from the C locale, matching RFC 2822 names
        if (formatUtc("%a, %d %b %Y %H:%M:%S +0000", out, out_size)) {
            return true;
        }
        out[0] = '\0';
        return false;
    }
}

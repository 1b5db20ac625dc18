#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/core/moisture_monitor.hpp>
#include <main/core/notifier.hpp>
#include <main/core/settings_check.hpp>
#include <main/hardware/mcp3008.hpp>
#include <main/hardware/stop_button.hpp>
#include <main/models/mail_settings.hpp>
#include <main/models/monitor_error.hpp>
#include <main/network/smtp_client.hpp>
#include <main/network/wifi_manager.hpp>
#include <main/state/runtime_settings.hpp>
#include <main/tasks/moisture_poll_task.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>
#include <nvs_flash.h>
#include <cstdint>

static const char* TAG = "MAIN";

namespace {
    static const MailSettings s_mail_settings = {
        Config::Mail::host,
        Config::Mail::port,
        Config::Mail::security,
        Config::Mail::username,
        Config::Mail::password,
        Config::Mail::from,
        Config::Mail::to,
        Config::Mail::subject_template,
        Config::Mail::body_template,
        Config::Device::id,
        Config::Mail::timeout_ms
    };

    // Equivalent of process exit: report and idle until manual restart
    [[noreturn]] static void finish(int exit_code) {
        if (exit_code == 0) {
            LOG_INFO(TAG, "%s", "Exiting... (code 0)");
        } else {
            LOG_ERROR(TAG, "Exiting... (code %d: %s); restart the device to resume notifications",
                      exit_code, monitorErrorName(static_cast<MonitorError>(exit_code)));
        }
        for (;;) {
            vTaskDelay(portMAX_DELAY);
        }
    }

    static MonitorError checkSettings(const MonitorSettings& monitor, uint8_t channel) {
        MonitorError err = SettingsCheck::checkMonitor(monitor, Config::Hardware::Adc::max_raw);
        if (err == MonitorError::NONE) {
            err = SettingsCheck::checkChannel(channel, Config::Hardware::Adc::channel_count);
        }
        if (err == MonitorError::NONE) {
            err = SettingsCheck::checkMail(s_mail_settings);
        }
        return err;
    }
}

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::INFO);
    Logger::setEspLogLevel("esp-tls", LogLevel::WARN);
    LOG_INFO(TAG, "%s", "---Soil moisture notifier started---");

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS init failed: %d", static_cast<int>(err));
        finish(exitCodeFor(MonitorError::CONFIGURATION_MISSING));
    }

    RuntimeSettings::init();
    const MonitorSettings monitor_settings = RuntimeSettings::monitor();
    const uint8_t channel = RuntimeSettings::adcChannel();

    MonitorError cfg_err = checkSettings(monitor_settings, channel);
    if (cfg_err != MonitorError::NONE) {
        finish(exitCodeFor(cfg_err));
    }

    Watchdog::init(Config::Watchdog::timeout_ms);

    static Mcp3008 s_adc(Mcp3008::Config{
        Config::Hardware::Adc::spi_host,
        Config::Hardware::Adc::mosi,
        Config::Hardware::Adc::miso,
        Config::Hardware::Adc::sclk,
        Config::Hardware::Adc::cs,
        Config::Hardware::Adc::clock_hz,
        channel
    });
    if (!s_adc.init()) {
        LOG_ERROR(TAG, "%s", "ADC not reachable on SPI");
        finish(exitCodeFor(MonitorError::HARDWARE_UNAVAILABLE));
    }

    // Network problems at boot are not fatal; the next send reports them
    static WiFiManager s_wifi(Config::Wifi::ssid, Config::Wifi::password, Config::Wifi::max_retry_count);
    if (!s_wifi.init()) {
        LOG_WARN(TAG, "%s", "WiFi init failed; polling anyway");
    } else {
        TimeSync::init();
        if (s_wifi.waitForIp(Config::Wifi::connect_timeout_ms)) {
            (void)TimeSync::waitForSync(Config::Time::sync_timeout_ms);
        } else {
            LOG_WARN(TAG, "%s", "WiFi not up yet; polling anyway");
        }
    }

    static SmtpClient s_smtp(s_mail_settings);
    static Notifier s_notifier(s_mail_settings, s_smtp);
    static MonitorContext s_ctx(s_adc, s_notifier, monitor_settings);

    static StopButton s_stop_button(Config::Hardware::Pins::stop_button_gpio,
                                    &MoisturePollTask::requestStopFromIsr);
    if (!s_stop_button.init()) {
        LOG_WARN(TAG, "%s", "Stop button unavailable; only a reset stops the loop");
    }

    MoisturePollTask::create(s_ctx, xTaskGetCurrentTaskHandle());

    uint32_t exit_code = 0;
    (void)xTaskNotifyWait(0, UINT32_MAX, &exit_code, portMAX_DELAY);
    finish(static_cast<int>(exit_code));
}

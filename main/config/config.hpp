#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>
#include <main/models/mail_settings.hpp>
#include <main/models/soil_state.hpp>
#include <driver/gpio.h>
#include <hal/spi_types.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    static constexpr int max_retry_count = 5;            // reconnect attempts per connect()
    static constexpr uint32_t connect_timeout_ms = 20000; // startup wait for an IP
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Hardware {
namespace Pins {
    // BOOT button; pressing it stops the poll loop cleanly
    static constexpr gpio_num_t stop_button_gpio = GPIO_NUM_0;
} // namespace Pins

// MCP3008 10-bit ADC on VSPI
namespace Adc {
    static constexpr spi_host_device_t spi_host = SPI3_HOST;
    static constexpr gpio_num_t mosi = GPIO_NUM_23;
    static constexpr gpio_num_t miso = GPIO_NUM_19;
    static constexpr gpio_num_t sclk = GPIO_NUM_18;
    static constexpr gpio_num_t cs   = GPIO_NUM_5;
    // MCP3008 is rated 1.35 MHz at 2.7 V
    static constexpr int clock_hz = 1350000;
    static constexpr uint8_t channel_count = 8;
    static constexpr uint16_t max_raw = 1023;
    static constexpr uint8_t default_channel = 0;
}
}

// Defaults; RuntimeSettings overrides these from NVS
namespace Monitoring {
    // Flip polarity for probes whose output rises as the soil dries
    static constexpr uint16_t dry_threshold = 450;
    static constexpr SensorPolarity polarity = SensorPolarity::LOW_IS_DRY;
    static constexpr NotifyPolicy notify_policy = NotifyPolicy::ON_TRANSITION;
}

namespace Mail {
    static constexpr const char* host = Secrets::SMTP_HOST;
    static constexpr int port = Secrets::SMTP_PORT;
    // 465 speaks TLS immediately; anything else (587, 25) upgrades with STARTTLS
    static constexpr SmtpSecurity security =
        (port == 465) ? SmtpSecurity::IMPLICIT_TLS : SmtpSecurity::STARTTLS;
    static constexpr const char* username = Secrets::SMTP_USER;
    static constexpr const char* password = Secrets::SMTP_PASS;
    static constexpr const char* from = Secrets::MAIL_FROM;
    static constexpr const char* to = Secrets::MAIL_TO;
    static constexpr uint32_t timeout_ms = 10000;

    static constexpr const char* subject_template = "[{{ device }}] Soil is dry ({{ reading }})";
    static constexpr const char* body_template =
        "<html>\n"
        "<body>\n"
        "<h2>Your plant needs water</h2>\n"
        "<p>Sensor <b>{{ device }}</b> read <b>{{ reading }}</b> on channel {{ channel }}"
        " at {{ timestamp }}.</p>\n"
        "<p>Dry threshold: {{ threshold }} ({{ polarity }}).</p>\n"
        "</body>\n"
        "</html>\n";
}

namespace Tasks {
namespace Poll {
    static constexpr uint32_t period_ms = 5000;
    // Longest single sleep so the watchdog is fed even with long poll periods
    static constexpr uint32_t max_sleep_ms = 2000;
    static constexpr uint32_t stack_bytes = 8192;   // TLS handshake needs headroom
}
}

namespace Watchdog {
    // Covers a full SMTP exchange (connect + TLS + dialog)
    static constexpr uint32_t timeout_ms = 30000;
}

namespace Time {
    static constexpr uint32_t sync_timeout_ms = 10000;
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Sensor sampling and mail dispatch tolerate latency
    static constexpr UBaseType_t NORMAL = tskIDLE_PRIORITY + 1;
}
}

#endif // CONFIG_HPP

#include <main/network/wifi_manager.hpp>
#include <main/utils/logger.hpp>
#include <esp_err.h>
#include <cstring>

static const char* TAG = "WiFiManager";

namespace {
    constexpr EventBits_t GOT_IP_BIT  = BIT0;
    constexpr EventBits_t GAVE_UP_BIT  = BIT1;
}

WiFiManager::WiFiManager(const char* ssid_in, const char* password_in, int max_retries_in)
    : ssid(ssid_in),
      password(password_in),
      max_retries(max_retries_in),
      attempts(0),
      events(nullptr),
      events_storage{},
      wifi_handler(nullptr),
      ip_handler(nullptr) {}

bool WiFiManager::init() {
    if (events != nullptr) {
        return true;
    }
    events = xEventGroupCreateStatic(&events_storage);

    ESP_ERROR_CHECK(esp_netif_init());
    esp_err_t err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Default event loop unavailable: %s", esp_err_to_name(err));
        return false;
    }
    if (esp_netif_create_default_wifi_sta() == nullptr) {
        LOG_ERROR(TAG, "%s", "Station netif not created");
        return false;
    }

    wifi_init_config_t init_cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&init_cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Driver init failed: %s", esp_err_to_name(err));
        return false;
    }

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT, ESP_EVENT_ANY_ID, &WiFiManager::onEvent, this, &wifi_handler));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT, IP_EVENT_STA_GOT_IP, &WiFiManager::onEvent, this, &ip_handler));

    wifi_config_t sta_cfg = {};
    std::strncpy(reinterpret_cast<char*>(sta_cfg.sta.ssid), ssid, sizeof(sta_cfg.sta.ssid) - 1);
    std::strncpy(reinterpret_cast<char*>(sta_cfg.sta.password), password, sizeof(sta_cfg.sta.password) - 1);
    sta_cfg.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    sta_cfg.sta.pmf_cfg.capable = true;

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));
    err = esp_wifi_set_config(WIFI_IF_STA, &sta_cfg);
    if (err == ESP_OK) {
        err = esp_wifi_start();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "Station start failed: %s", esp_err_to_name(err));
        return false;
    }
    return true;
}

bool WiFiManager::waitForIp(uint32_t timeout_ms) {
    if (events == nullptr) {
        return false;
    }
    const EventBits_t bits = xEventGroupWaitBits(events, GOT_IP_BIT | GAVE_UP_BIT,
                                                 pdFALSE, pdFALSE, pdMS_TO_TICKS(timeout_ms));
    if (bits & GOT_IP_BIT) {
        return true;
    }
    if (bits & GAVE_UP_BIT) {
        LOG_WARN(TAG, "Gave up on '%s' after %d attempts", ssid, max_retries);
    } else {
        LOG_WARN(TAG, "No address within %lu ms", static_cast<unsigned long>(timeout_ms));
    }
    return false;
}

void WiFiManager::onEvent(void* arg, esp_event_base_t base, int32_t id, void* data) {
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (base == WIFI_EVENT) {
        self->handleWifiEvent(id, data);
    } else if (base == IP_EVENT) {
        self->handleIpEvent(id, data);
    }
}

void WiFiManager::handleWifiEvent(int32_t id, void* data) {
    if (id == WIFI_EVENT_STA_START) {
        LOG_INFO(TAG, "Associating with '%s'", ssid);
        (void)esp_wifi_connect();
        return;
    }
    if (id != WIFI_EVENT_STA_DISCONNECTED) {
        return;
    }

    xEventGroupClearBits(events, GOT_IP_BIT);
    const wifi_event_sta_disconnected_t* info = static_cast<const wifi_event_sta_disconnected_t*>(data);
    const int reason = info != nullptr ? static_cast<int>(info->reason) : -1;
    if (attempts >= max_retries) {
        LOG_ERROR(TAG, "Disconnected (reason %d); no retries left", reason);
        xEventGroupSetBits(events, GAVE_UP_BIT);
        return;
    }
    ++attempts;
    LOG_WARN(TAG, "Disconnected (reason %d); attempt %d/%d", reason, attempts, max_retries);
    (void)esp_wifi_connect();
}

void WiFiManager::handleIpEvent(int32_t id, void* data) {
    if (id != IP_EVENT_STA_GOT_IP) {
        return;
    }
    const ip_event_got_ip_t* got = static_cast<const ip_event_got_ip_t*>(data);
    LOG_INFO(TAG, "Address " IPSTR, IP2STR(&got->ip_info.ip));
    attempts = 0;
    xEventGroupClearBits(events, GAVE_UP_BIT);
    xEventGroupSetBits(events, GOT_IP_BIT);
}

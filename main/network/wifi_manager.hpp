#ifndef WIFI_MANAGER_HPP
#define WIFI_MANAGER_HPP

#include <cstdint>
#include <esp_event.h>
#include <esp_netif.h>
#include <esp_wifi.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

// Station-mode Wi-Fi with a bounded number of reconnect attempts.
// NVS must be initialized before init().
class WiFiManager {
public:
    WiFiManager(const char* ssid, const char* password, int max_retries);

    // Start the station; association continues in the background
    bool init();

    // Block until an address is assigned, retries run out, or timeout_ms elapses
    bool waitForIp(uint32_t timeout_ms);

private:
    static void onEvent(void* arg, esp_event_base_t base, int32_t id, void* data);
    void handleWifiEvent(int32_t id, void* data);
    void handleIpEvent(int32_t id, void* data);

    const char* ssid;
    const char* password;
    int max_retries;
    int attempts;

    EventGroupHandle_t events;
    StaticEventGroup_t events_storage;

    esp_event_handler_instance_t wifi_handler;
    esp_event_handler_instance_t ip_handler;
};

#endif // WIFI_MANAGER_HPP

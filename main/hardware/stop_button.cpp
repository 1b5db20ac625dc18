#include <main/hardware/stop_button.hpp>
#include <main/utils/logger.hpp>
#include <esp_attr.h>
#include <esp_err.h>

static const char* TAG = "STOP_BUTTON";

StopButton::StopButton(gpio_num_t button_pin, IsrCallback callback)
    : pin(button_pin), on_press(callback) {}

bool StopButton::init() {
    gpio_config_t io_conf = {};
    io_conf.intr_type = GPIO_INTR_NEGEDGE;
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << pin);
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.pull_up_en = GPIO_PULLUP_ENABLE;
    if (gpio_config(&io_conf) != ESP_OK) {
        LOG_ERROR(TAG, "gpio_config failed for GPIO %d", static_cast<int>(pin));
        return false;
    }

    esp_err_t err = gpio_install_isr_service(0);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "ISR service install failed: %d", static_cast<int>(err));
        return false;
    }
    err = gpio_isr_handler_add(pin, &StopButton::isrHandler, this);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "ISR handler add failed: %d", static_cast<int>(err));
        return false;
    }
    LOG_INFO(TAG, "Press GPIO %d to stop monitoring", static_cast<int>(pin));
    return true;
}

void IRAM_ATTR StopButton::isrHandler(void* arg) {
    StopButton* self = static_cast<StopButton*>(arg);
    if (self->on_press) {
        self->on_press();
    }
}

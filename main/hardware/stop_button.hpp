#ifndef STOP_BUTTON_HPP
#define STOP_BUTTON_HPP

#include <driver/gpio.h>

// Active-low push button (e.g. the BOOT button) that fires a callback from
// its falling-edge interrupt.
class StopButton {
public:
    using IsrCallback = void (*)();

    StopButton(gpio_num_t pin, IsrCallback on_press);

    // Configure input with pull-up and attach the ISR
    bool init();

private:
    static void isrHandler(void* arg);

    gpio_num_t pin;
    IsrCallback on_press;
};

#endif // STOP_BUTTON_HPP

#ifndef MOISTURE_POLL_TASK_HPP
#define MOISTURE_POLL_TASK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/core/moisture_monitor.hpp>

namespace MoisturePollTask {
    // Start polling ctx every ctx.settings.period_ms. When the loop ends the
    // exit code (0 = stopped, otherwise the MonitorError value) is delivered
    // to exit_listener as a task notification value.
    void create(MonitorContext& ctx, TaskHandle_t exit_listener);

    // Request a clean stop; safe to call from an ISR
    void requestStopFromIsr();
}

#endif // MOISTURE_POLL_TASK_HPP

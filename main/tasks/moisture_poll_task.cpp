#include <main/tasks/moisture_poll_task.hpp>
#include <freertos/task.h>
#include <esp_attr.h>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/tick_scheduler.hpp>
#include <main/utils/time_sync.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "POLL_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Poll::stack_bytes / sizeof(StackType_t)];
    static TaskHandle_t s_task = nullptr;

    static MonitorContext* s_ctx = nullptr;
    static TaskHandle_t s_exit_listener = nullptr;
    static volatile bool s_stop_requested = false;

    // One monitor per slot; a second sensor would be one more add()
    static TickScheduler<1> s_scheduler;

    static uint32_t nowMs() {
        return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
    }

    static bool tickMonitor(void* arg, uint32_t now_ms) {
        MonitorContext* ctx = static_cast<MonitorContext*>(arg);
        char timestamp[32];
        (void)TimeSync::formatTimestamp(timestamp, sizeof(timestamp));
        return MoistureMonitor::pollOnce(*ctx, now_ms, timestamp) == MonitorError::NONE;
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "Moisture poll task started (every %lu ms)",
                 static_cast<unsigned long>(s_ctx->settings.period_ms));
        const bool watched = Watchdog::subscribe();

        if (!s_scheduler.add(&tickMonitor, s_ctx, s_ctx->settings.period_ms, nowMs())) {
            LOG_ERROR(TAG, "%s", "Scheduler full");
            s_ctx->fault = MonitorError::CONFIGURATION_MISSING;
        }

        while (!s_stop_requested && s_scheduler.activeCount() > 0) {
            if (watched) {
                Watchdog::feed();
            }
            s_scheduler.runDue(nowMs());

            uint32_t delay_ms = 0;
            if (!s_scheduler.nextDelay(nowMs(), delay_ms)) {
                break; // every monitor retired on a fault
            }
            if (delay_ms > Config::Tasks::Poll::max_sleep_ms) {
                delay_ms = Config::Tasks::Poll::max_sleep_ms;
            }
            // A stop request wakes us early
            (void)ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(delay_ms));
        }

        const MonitorError fault = s_ctx->fault;
        const int exit_code = exitCodeFor(fault);
        if (fault == MonitorError::NONE) {
            LOG_INFO(TAG, "%s", "Stop requested");
        } else {
            LOG_ERROR(TAG, "Poll loop halted: %s", monitorErrorName(fault));
        }
        LOG_INFO(TAG, "Polls=%lu gains=%lu losses=%lu mails=%lu last_read=%lu ms",
                 static_cast<unsigned long>(s_ctx->poll_count),
                 static_cast<unsigned long>(s_ctx->gain_count),
                 static_cast<unsigned long>(s_ctx->loss_count),
                 static_cast<unsigned long>(s_ctx->notifier.sentCount()),
                 static_cast<unsigned long>(s_ctx->last_read_ms));

        if (watched) {
            Watchdog::unsubscribe();
        }
        if (s_exit_listener != nullptr) {
            (void)xTaskNotify(s_exit_listener, static_cast<uint32_t>(exit_code), eSetValueWithOverwrite);
        }
        s_task = nullptr;
        vTaskDelete(nullptr);
    }
}

namespace MoisturePollTask {
    void create(MonitorContext& ctx, TaskHandle_t exit_listener) {
        s_ctx = &ctx;
        s_exit_listener = exit_listener;
        s_stop_requested = false;
        s_task = xTaskCreateStatic(taskFunction, "moisture_poll",
                                   sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                                   Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
    }

    void IRAM_ATTR requestStopFromIsr() {
        s_stop_requested = true;
        if (s_task != nullptr) {
            BaseType_t higher_prio_woken = pdFALSE;
            vTaskNotifyGiveFromISR(s_task, &higher_prio_woken);
            portYIELD_FROM_ISR(higher_prio_woken);
        }
    }
}

#include <main/core/moisture_monitor.hpp>
#include <main/core/threshold_evaluator.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "MONITOR";

MonitorContext::MonitorContext(MoistureSource& source_in, Notifier& notifier_in, const MonitorSettings& settings_in)
    : source(source_in),
      notifier(notifier_in),
      settings(settings_in),
      has_state(false),
      last_state(SoilState::WET),
      has_reading(false),
      last_raw(0),
      last_read_ms(0),
      gain_count(0),
      loss_count(0),
      poll_count(0),
      fault(MonitorError::NONE) {}

namespace {
    static void trackChange(MonitorContext& ctx, uint16_t raw) {
        if (ctx.has_reading && raw == ctx.last_raw) {
            return;
        }
        if (ctx.has_reading) {
            if (ThresholdEvaluator::isDrying(ctx.last_raw, raw, ctx.settings.polarity)) {
                ++ctx.loss_count;
                LOG_INFO(TAG, "Moisture loss detected! (#%lu)", static_cast<unsigned long>(ctx.loss_count));
            } else {
                ++ctx.gain_count;
                LOG_INFO(TAG, "Moisture gain detected! (#%lu)", static_cast<unsigned long>(ctx.gain_count));
            }
        }
        LOG_INFO(TAG, "Value: %u", static_cast<unsigned>(raw));
        ctx.has_reading = true;
        ctx.last_raw = raw;
    }
}

namespace MoistureMonitor {
    bool shouldNotify(const MonitorContext& ctx, SoilState next) {
        if (next != SoilState::DRY) {
            return false;
        }
        if (ctx.settings.notify_policy == NotifyPolicy::EVERY_DRY_READING) {
            return true;
        }
        // Unknown prior state counts as WET
        return !ctx.has_state || ctx.last_state == SoilState::WET;
    }

    MonitorError pollOnce(MonitorContext& ctx, uint32_t now_ms, const char* timestamp) {
        if (ctx.fault != MonitorError::NONE) {
            return ctx.fault;
        }
        ++ctx.poll_count;

        MoistureData sample{};
        if (!ctx.source.read(sample)) {
            LOG_ERROR(TAG, "%s", "Moisture read failed; sensor unavailable");
            ctx.fault = MonitorError::HARDWARE_UNAVAILABLE;
            return ctx.fault;
        }
        sample.ts_ms = now_ms;
        ctx.last_read_ms = now_ms;

        trackChange(ctx, sample.moisture_raw);

        const SoilState next = ThresholdEvaluator::evaluate(
            sample.moisture_raw, ctx.settings.dry_threshold, ctx.settings.polarity);
        const bool notify = shouldNotify(ctx, next);

        if (!ctx.has_state || next != ctx.last_state) {
            LOG_INFO(TAG, "Soil %s -> %s (raw=%u threshold=%u)",
                     ctx.has_state ? soilStateName(ctx.last_state) : "UNKNOWN",
                     soilStateName(next),
                     static_cast<unsigned>(sample.moisture_raw),
                     static_cast<unsigned>(ctx.settings.dry_threshold));
        }
        ctx.has_state = true;
        ctx.last_state = next;

        if (!notify) {
            return MonitorError::NONE;
        }

        MonitorError err = ctx.notifier.notifyDry(sample, ctx.settings, timestamp);
        if (err != MonitorError::NONE) {
            LOG_ERROR(TAG, "Notification failed: %s", monitorErrorName(err));
            ctx.fault = err;
        }
        return err;
    }
}

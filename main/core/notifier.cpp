#include <main/core/notifier.hpp>
#include <main/utils/template_renderer.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>

static const char* TAG = "NOTIFIER";

Notifier::Notifier(const MailSettings& settings_in, MailTransport& transport_in)
    : settings(settings_in), transport(transport_in), message{}, sent_count(0) {}

bool Notifier::compose(const MoistureData& reading, const MonitorSettings& monitor, const char* timestamp) {
    char reading_str[8];
    char threshold_str[8];
    char channel_str[4];
    snprintf(reading_str, sizeof(reading_str), "%u", static_cast<unsigned>(reading.moisture_raw));
    snprintf(threshold_str, sizeof(threshold_str), "%u", static_cast<unsigned>(monitor.dry_threshold));
    snprintf(channel_str, sizeof(channel_str), "%u", static_cast<unsigned>(reading.channel));

    const TemplateVar vars[] = {
        { "reading",   reading_str },
        { "threshold", threshold_str },
        { "channel",   channel_str },
        { "timestamp", timestamp },
        { "device",    settings.device_id },
        { "state",     soilStateName(SoilState::DRY) },
        { "polarity",  polarityName(monitor.polarity) },
    };
    const std::size_t var_count = sizeof(vars) / sizeof(vars[0]);

    snprintf(message.from, sizeof(message.from), "%s", settings.from ? settings.from : "");
    snprintf(message.to, sizeof(message.to), "%s", settings.to ? settings.to : "");

    if (!TemplateRenderer::render(settings.subject_template, vars, var_count,
                                  message.subject, sizeof(message.subject))) {
        LOG_ERROR(TAG, "Subject template exceeds %u bytes", static_cast<unsigned>(sizeof(message.subject) - 1));
        return false;
    }
    if (!TemplateRenderer::render(settings.body_template, vars, var_count,
                                  message.body, sizeof(message.body))) {
        LOG_ERROR(TAG, "Body template exceeds %u bytes", static_cast<unsigned>(sizeof(message.body) - 1));
        return false;
    }
    return true;
}

MonitorError Notifier::notifyDry(const MoistureData& reading, const MonitorSettings& monitor, const char* timestamp) {
    if (!compose(reading, monitor, timestamp ? timestamp : "")) {
        return MonitorError::CONFIGURATION_MISSING;
    }

    LOG_INFO(TAG, "Sending dry-soil mail to %s (raw=%u)", message.to, static_cast<unsigned>(reading.moisture_raw));
    if (!transport.send(message)) {
        LOG_ERROR(TAG, "%s", "Unable to send email");
        return MonitorError::NETWORK_UNAVAILABLE;
    }

    ++sent_count;
    LOG_INFO(TAG, "Successfully sent email (#%lu)", static_cast<unsigned long>(sent_count));
    return MonitorError::NONE;
}

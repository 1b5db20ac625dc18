#ifndef NOTIFIER_HPP
#define NOTIFIER_HPP

#include <cstdint>
#include <main/core/mail_transport.hpp>
#include <main/models/mail_message.hpp>
#include <main/models/mail_settings.hpp>
#include <main/models/moisture_data.hpp>
#include <main/models/monitor_error.hpp>
#include <main/models/monitor_settings.hpp>

// Renders the dry-soil mail from the configured templates and hands it to a
// MailTransport. Placeholders: reading, threshold, channel, timestamp,
// device, state, polarity.
class Notifier {
public:
    Notifier(const MailSettings& settings, MailTransport& transport);

    // Render and send one DRY notification.
    // NETWORK_UNAVAILABLE if the transport fails, CONFIGURATION_MISSING if the
    // templates do not fit the message buffers (nothing is sent then).
    MonitorError notifyDry(const MoistureData& reading, const MonitorSettings& monitor, const char* timestamp);

    uint32_t sentCount() const { return sent_count; }
    const MailMessage& lastMessage() const { return message; }

private:
    bool compose(const MoistureData& reading, const MonitorSettings& monitor, const char* timestamp);

    MailSettings settings;
    MailTransport& transport;
    MailMessage message;
    uint32_t sent_count;
};

#endif // NOTIFIER_HPP

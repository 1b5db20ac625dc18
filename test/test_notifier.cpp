#include <gtest/gtest.h>
#include <string>
#include <main/core/notifier.hpp>
#include "support/fakes.hpp"

namespace {
    MailSettings baseSettings() {
        MailSettings m{};
        m.host = "smtp.example.com";
        m.port = 465;
        m.username = "user";
        m.password = "pass";
        m.from = "plantbot@example.com";
        m.to = "owner@example.com";
        m.subject_template = "[{{ device }}] {{ state }} soil ({{ reading }})";
        m.body_template =
            "<p>{{ device }} read {{ reading }} on channel {{ channel }} at {{ timestamp }}.</p>\n"
            "<p>Threshold {{ threshold }} ({{ polarity }})</p>";
        m.device_id = "greenhouse-1";
        m.timeout_ms = 1000;
        return m;
    }

    MonitorSettings monitorSettings() {
        MonitorSettings s{};
        s.dry_threshold = 450;
        s.polarity = SensorPolarity::LOW_IS_DRY;
        s.notify_policy = NotifyPolicy::ON_TRANSITION;
        s.period_ms = 1000;
        return s;
    }

    MoistureData reading(uint16_t raw, uint8_t channel = 3) {
        MoistureData d{};
        d.moisture_raw = raw;
        d.channel = channel;
        d.ts_ms = 42;
        return d;
    }
}

TEST(NotifierTest, RendersSubjectAndBodyFromTemplates) {
    RecordingTransport transport;
    Notifier notifier(baseSettings(), transport);

    ASSERT_EQ(MonitorError::NONE,
              notifier.notifyDry(reading(312), monitorSettings(), "2026-10-19 08:30:00 UTC"));

    ASSERT_EQ(1u, transport.sent().size());
    const SentMail& mail = transport.sent()[0];
    EXPECT_EQ("plantbot@example.com", mail.from);
    EXPECT_EQ("owner@example.com", mail.to);
    EXPECT_EQ("[greenhouse-1] DRY soil (312)", mail.subject);
    EXPECT_EQ("<p>greenhouse-1 read 312 on channel 3 at 2026-10-19 08:30:00 UTC.</p>\n"
              "<p>Threshold 450 (low-is-dry)</p>",
              mail.body);
}

TEST(NotifierTest, CountsOnlySuccessfulSends) {
    RecordingTransport transport;
    Notifier notifier(baseSettings(), transport);

    EXPECT_EQ(MonitorError::NONE, notifier.notifyDry(reading(100), monitorSettings(), "t"));
    transport.setFailing(true);
    EXPECT_EQ(MonitorError::NETWORK_UNAVAILABLE, notifier.notifyDry(reading(100), monitorSettings(), "t"));

    EXPECT_EQ(1u, notifier.sentCount());
    EXPECT_EQ(2, transport.attempts());
}

TEST(NotifierTest, OversizedTemplateIsConfigurationErrorAndNotSent) {
    RecordingTransport transport;
    MailSettings settings = baseSettings();
    std::string huge(MailMessage::BODY_LEN + 10, 'x');
    settings.body_template = huge.c_str();
    Notifier notifier(settings, transport);

    EXPECT_EQ(MonitorError::CONFIGURATION_MISSING,
              notifier.notifyDry(reading(100), monitorSettings(), "t"));
    EXPECT_EQ(0, transport.attempts());
}

TEST(NotifierTest, NullTimestampRendersEmpty) {
    RecordingTransport transport;
    MailSettings settings = baseSettings();
    settings.body_template = "at [{{ timestamp }}]";
    Notifier notifier(settings, transport);

    ASSERT_EQ(MonitorError::NONE, notifier.notifyDry(reading(100), monitorSettings(), nullptr));
    EXPECT_EQ("at []", transport.sent()[0].body);
    EXPECT_STREQ("at []", notifier.lastMessage().body);
}

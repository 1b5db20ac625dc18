#include <gtest/gtest.h>
#include <main/core/moisture_monitor.hpp>
#include <main/core/notifier.hpp>
#include "support/fakes.hpp"
#include "support/log_capture.hpp"

namespace {
    MailSettings testMail() {
        MailSettings m{};
        m.host = "smtp.example.com";
        m.port = 465;
        m.username = "user";
        m.password = "pass";
        m.from = "plantbot@example.com";
        m.to = "owner@example.com";
        m.subject_template = "[{{ device }}] Soil is dry ({{ reading }})";
        m.body_template = "<p>Reading {{ reading }} below {{ threshold }} at {{ timestamp }}</p>";
        m.device_id = "bench";
        m.timeout_ms = 1000;
        return m;
    }

    MonitorSettings testMonitor(NotifyPolicy policy = NotifyPolicy::ON_TRANSITION,
                                SensorPolarity polarity = SensorPolarity::LOW_IS_DRY) {
        MonitorSettings s{};
        s.dry_threshold = 450;
        s.polarity = polarity;
        s.notify_policy = policy;
        s.period_ms = 1000;
        return s;
    }
}

class MoistureMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogCapture::clear();
    }

    MonitorError poll(MonitorContext& ctx, uint32_t now_ms = 0) {
        return MoistureMonitor::pollOnce(ctx, now_ms, "2026-10-19 08:30:00 UTC");
    }

    FakeMoistureSource source;
    RecordingTransport transport;
    MailSettings mail = testMail();
};

TEST_F(MoistureMonitorTest, DryReadingSendsOneMailWithReading) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.push(300);

    EXPECT_EQ(MonitorError::NONE, poll(ctx));

    ASSERT_EQ(1u, transport.sent().size());
    EXPECT_NE(std::string::npos, transport.sent()[0].body.find("300"));
    EXPECT_EQ(SoilState::DRY, ctx.last_state);
    EXPECT_EQ(1u, notifier.sentCount());
}

TEST_F(MoistureMonitorTest, ReadingIsStampedWithPollTime) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.push(600);
    source.push(610);

    ASSERT_EQ(MonitorError::NONE, poll(ctx, 5000));
    EXPECT_EQ(5000u, ctx.last_read_ms);
    ASSERT_EQ(MonitorError::NONE, poll(ctx, 10000));
    EXPECT_EQ(10000u, ctx.last_read_ms);
}

TEST_F(MoistureMonitorTest, WetReadingSendsNothing) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.push(600);

    EXPECT_EQ(MonitorError::NONE, poll(ctx));

    EXPECT_EQ(0, transport.attempts());
    EXPECT_EQ(SoilState::WET, ctx.last_state);
}

TEST_F(MoistureMonitorTest, ReadingAtThresholdIsWet) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.push(450);

    EXPECT_EQ(MonitorError::NONE, poll(ctx));
    EXPECT_EQ(0, transport.attempts());
}

TEST_F(MoistureMonitorTest, HardwareFailureSurfacesAndSendsNothing) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.failNextReads(true);

    EXPECT_EQ(MonitorError::HARDWARE_UNAVAILABLE, poll(ctx));

    EXPECT_EQ(0, transport.attempts());
    EXPECT_EQ(MonitorError::HARDWARE_UNAVAILABLE, ctx.fault);
    EXPECT_TRUE(LogCapture::contains("Moisture read failed"));
}

TEST_F(MoistureMonitorTest, FaultIsLatchedUntilRestart) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    source.failNextReads(true);
    ASSERT_EQ(MonitorError::HARDWARE_UNAVAILABLE, poll(ctx));

    // Hardware comes back, but the loop stays stopped
    source.failNextReads(false);
    source.push(100);
    EXPECT_EQ(MonitorError::HARDWARE_UNAVAILABLE, poll(ctx, 1000));
    EXPECT_EQ(1, source.reads());
    EXPECT_EQ(0, transport.attempts());
}

TEST_F(MoistureMonitorTest, OnTransitionPolicyMailsOncePerDrySpell) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor(NotifyPolicy::ON_TRANSITION));
    for (uint16_t raw : {600, 300, 290, 280, 700, 200, 210}) {
        source.push(raw);
    }

    for (uint32_t i = 0; i < 7; ++i) {
        ASSERT_EQ(MonitorError::NONE, poll(ctx, i * 1000));
    }

    // WET, DRY(mail), DRY, DRY, WET, DRY(mail), DRY
    ASSERT_EQ(2u, transport.sent().size());
    EXPECT_NE(std::string::npos, transport.sent()[0].body.find("300"));
    EXPECT_NE(std::string::npos, transport.sent()[1].body.find("200"));
}

TEST_F(MoistureMonitorTest, OnTransitionPolicyMailsWhenFirstReadingIsDry) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor(NotifyPolicy::ON_TRANSITION));
    source.push(100);
    source.push(100);

    ASSERT_EQ(MonitorError::NONE, poll(ctx));
    ASSERT_EQ(MonitorError::NONE, poll(ctx, 1000));

    EXPECT_EQ(1u, transport.sent().size());
}

TEST_F(MoistureMonitorTest, EveryDryReadingPolicyMailsOnEachDryPoll) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor(NotifyPolicy::EVERY_DRY_READING));
    for (uint16_t raw : {300, 300, 600, 300}) {
        source.push(raw);
    }

    for (uint32_t i = 0; i < 4; ++i) {
        ASSERT_EQ(MonitorError::NONE, poll(ctx, i * 1000));
    }

    EXPECT_EQ(3u, transport.sent().size());
}

TEST_F(MoistureMonitorTest, HighIsDryPolarityNotifiesOnHighReading) {
    Notifier notifier(mail, transport);
    MonitorSettings settings = testMonitor(NotifyPolicy::ON_TRANSITION, SensorPolarity::HIGH_IS_DRY);
    settings.dry_threshold = 800;
    MonitorContext ctx(source, notifier, settings);
    source.push(550);
    source.push(850);

    ASSERT_EQ(MonitorError::NONE, poll(ctx));
    EXPECT_EQ(0, transport.attempts());
    ASSERT_EQ(MonitorError::NONE, poll(ctx, 1000));
    ASSERT_EQ(1u, transport.sent().size());
    EXPECT_NE(std::string::npos, transport.sent()[0].body.find("850"));
}

TEST_F(MoistureMonitorTest, SendFailureSurfacesNetworkError) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    transport.setFailing(true);
    source.push(300);

    EXPECT_EQ(MonitorError::NETWORK_UNAVAILABLE, poll(ctx));
    EXPECT_EQ(MonitorError::NETWORK_UNAVAILABLE, ctx.fault);
    EXPECT_EQ(1, transport.attempts());

    // No further reads or sends once stopped
    EXPECT_EQ(MonitorError::NETWORK_UNAVAILABLE, poll(ctx, 1000));
    EXPECT_EQ(1, source.reads());
    EXPECT_EQ(1, transport.attempts());
}

TEST_F(MoistureMonitorTest, CountsGainAndLossByPolarity) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor());
    for (uint16_t raw : {600, 580, 580, 620, 560}) {
        source.push(raw);
    }

    for (uint32_t i = 0; i < 5; ++i) {
        ASSERT_EQ(MonitorError::NONE, poll(ctx, i * 1000));
    }

    // Low-is-dry: 600->580 loss, 580->620 gain, 620->560 loss; first reading not counted
    EXPECT_EQ(2u, ctx.loss_count);
    EXPECT_EQ(1u, ctx.gain_count);
    EXPECT_EQ(5u, ctx.poll_count);
    EXPECT_TRUE(LogCapture::contains("Moisture loss detected! (#2)"));
    EXPECT_TRUE(LogCapture::contains("Moisture gain detected! (#1)"));
    // Unchanged value is not logged again
    EXPECT_EQ(4u, LogCapture::count("Value: "));
}

TEST_F(MoistureMonitorTest, ShouldNotifyNeverForWet) {
    Notifier notifier(mail, transport);
    MonitorContext ctx(source, notifier, testMonitor(NotifyPolicy::EVERY_DRY_READING));
    EXPECT_FALSE(MoistureMonitor::shouldNotify(ctx, SoilState::WET));
    EXPECT_TRUE(MoistureMonitor::shouldNotify(ctx, SoilState::DRY));
}

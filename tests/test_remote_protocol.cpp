// =============================================================================
// Unit tests for remoteProtocol.hpp and keepAliveManager.hpp
// Tests: configuration exchange, dispatch ordering, status bookkeeping,
//        command gating, keep-alive deadline
// =============================================================================
#include <gtest/gtest.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>

#include "ATVErrors.hpp"
#include "keepAliveManager.hpp"
#include "remoteProtocol.hpp"

using namespace AndroidTV;
using namespace AndroidTV::Remote;
using namespace std::chrono_literals;
using Messages::RemoteMessage;
using Messages::RemoteMessageKind;

namespace {

RemoteMessage deviceConfigure(int32_t code1) {
    RemoteMessage message;
    auto *configure = message.mutable_remote_configure();
    configure->set_code1(code1);
    configure->mutable_device_info()->set_vendor("NVIDIA");
    configure->mutable_device_info()->set_model("SHIELD Android TV");
    configure->mutable_device_info()->set_app_version("9.1.0");
    return message;
}

RemoteMessage deviceSetActive() {
    RemoteMessage message;
    message.mutable_remote_set_active();
    return message;
}

RemoteMessage deviceStart(bool started) {
    RemoteMessage message;
    message.mutable_remote_start()->set_started(started);
    return message;
}

RemoteMessage devicePing(int32_t val1) {
    RemoteMessage message;
    message.mutable_remote_ping_request()->set_val1(val1);
    return message;
}

RemoteMessage deviceVolume(uint32_t level, uint32_t max, bool muted) {
    RemoteMessage message;
    auto *volume = message.mutable_remote_set_volume_level();
    volume->set_volume_level(level);
    volume->set_volume_max(max);
    volume->set_volume_muted(muted);
    return message;
}

RemoteMessage deviceImeKeyInject(const std::string &package, int32_t counter, int32_t field) {
    RemoteMessage message;
    auto *inject = message.mutable_remote_ime_key_inject();
    inject->mutable_app_info()->set_app_package(package);
    inject->mutable_app_info()->set_counter(counter);
    inject->mutable_text_field_status()->set_counter_field(field);
    return message;
}

RemoteMessage deviceError() {
    RemoteMessage message;
    message.mutable_remote_error()->set_value(true);
    return message;
}

void completeHandshake(RemoteProtocol &protocol) {
    protocol.onMessage(deviceConfigure(639));
    protocol.onMessage(deviceSetActive());
    auto step = protocol.onMessage(deviceStart(true));
    ASSERT_TRUE(step.started);
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration exchange
// ---------------------------------------------------------------------------
TEST(RemoteProtocolTest, ConfigurationExchangeOrdering) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    protocol.beginHandshake();

    auto step = protocol.onMessage(deviceConfigure(639));
    ASSERT_EQ(step.replies.size(), 1u);
    EXPECT_EQ(Messages::kindOf(step.replies[0]), RemoteMessageKind::Configure);
    EXPECT_EQ(step.replies[0].remote_configure().code1(), 639);
    EXPECT_EQ(step.replies[0].remote_configure().device_info().package_name(), "atvremote");
    EXPECT_FALSE(step.started);
    EXPECT_TRUE(step.updates.empty());
    EXPECT_FALSE(protocol.isStarted());

    step = protocol.onMessage(deviceSetActive());
    ASSERT_EQ(step.replies.size(), 1u);
    EXPECT_EQ(step.replies[0].remote_set_active().active(), 639);

    step = protocol.onMessage(deviceStart(true));
    EXPECT_TRUE(step.started);
    EXPECT_TRUE(step.replies.empty());
    EXPECT_TRUE(protocol.isStarted());
    EXPECT_TRUE(protocol.isOn());
    EXPECT_NE(std::find(step.updates.begin(), step.updates.end(), StatusField::IsOn),
              step.updates.end());

    auto device = protocol.deviceInfo();
    EXPECT_EQ(device.manufacturer, "NVIDIA");
    EXPECT_EQ(device.model, "SHIELD Android TV");
    EXPECT_EQ(device.softwareVersion, "9.1.0");
}

TEST(RemoteProtocolTest, ZeroCode1KeepsConfiguredMask) {
    RemoteDeviceConfig device;
    device.featureMask = 622;
    RemoteProtocol protocol{device};
    protocol.beginHandshake();
    auto step = protocol.onMessage(deviceConfigure(0));
    ASSERT_EQ(step.replies.size(), 1u);
    EXPECT_EQ(step.replies[0].remote_configure().code1(), 622);
    EXPECT_EQ(protocol.activeMask(), 622);
}

TEST(RemoteProtocolTest, ErrorDuringExchangeIsHandshakeError) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    protocol.beginHandshake();
    protocol.onMessage(deviceConfigure(639));
    EXPECT_THROW(protocol.onMessage(deviceError()), HandshakeError);
    EXPECT_FALSE(protocol.isStarted());
}

TEST(RemoteProtocolTest, ErrorAfterStartIsTolerated) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);
    EXPECT_NO_THROW(protocol.onMessage(deviceError()));
    EXPECT_TRUE(protocol.isStarted());
}

TEST(RemoteProtocolTest, BeginHandshakeForgetsPreviousExchange) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);
    protocol.beginHandshake();
    EXPECT_FALSE(protocol.isStarted());
    EXPECT_EQ(protocol.activeMask(), 622);
}

TEST(RemoteProtocolTest, ReconnectStartsWithEmptyStatus) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);
    protocol.onMessage(deviceVolume(42, 100, true));
    protocol.onMessage(deviceImeKeyInject("com.netflix.ninja", 5, 6));
    ASSERT_EQ(protocol.volume().level, 42);
    ASSERT_EQ(protocol.currentApp(), "com.netflix.ninja");

    protocol.beginHandshake();
    EXPECT_FALSE(protocol.isOn());
    EXPECT_EQ(protocol.volume(), VolumeInfo{});
    EXPECT_EQ(protocol.currentApp(), "");
    EXPECT_EQ(protocol.deviceInfo(), DeviceInfo{});
    EXPECT_EQ(protocol.imeCounter(), 0);
    EXPECT_EQ(protocol.fieldCounter(), 0);

    completeHandshake(protocol);
    auto status = protocol.status();
    EXPECT_TRUE(status.isOn);
    EXPECT_EQ(status.device.manufacturer, "NVIDIA");
    EXPECT_EQ(status.volume.level, 0);
    EXPECT_EQ(status.currentApp, "");
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
TEST(RemoteProtocolTest, PingAnsweredWithSameValue) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    protocol.beginHandshake();
    auto step = protocol.onMessage(devicePing(42));
    EXPECT_TRUE(step.keepAlive);
    ASSERT_EQ(step.replies.size(), 1u);
    EXPECT_EQ(Messages::kindOf(step.replies[0]), RemoteMessageKind::PingResponse);
    EXPECT_EQ(step.replies[0].remote_ping_response().val1(), 42);
}

TEST(RemoteProtocolTest, StatusBeforeStartIsDropped) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    protocol.beginHandshake();
    protocol.onMessage(deviceConfigure(639));

    auto step = protocol.onMessage(deviceVolume(10, 100, false));
    EXPECT_TRUE(step.updates.empty());
    EXPECT_EQ(protocol.volume(), VolumeInfo{});

    step = protocol.onMessage(deviceImeKeyInject("com.netflix.ninja", 1, 2));
    EXPECT_TRUE(step.updates.empty());
    EXPECT_TRUE(protocol.currentApp().empty());
}

TEST(RemoteProtocolTest, VolumeUpdateAfterStart) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);

    auto step = protocol.onMessage(deviceVolume(12, 100, true));
    ASSERT_EQ(step.updates.size(), 1u);
    EXPECT_EQ(step.updates[0], StatusField::Volume);
    EXPECT_EQ(protocol.volume(), (VolumeInfo{12, 100, true}));
}

TEST(RemoteProtocolTest, CurrentAppAndImeCounters) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);

    auto step = protocol.onMessage(deviceImeKeyInject("com.google.android.youtube.tv", 7, 9));
    ASSERT_EQ(step.updates.size(), 1u);
    EXPECT_EQ(step.updates[0], StatusField::CurrentApp);
    EXPECT_EQ(protocol.currentApp(), "com.google.android.youtube.tv");
    EXPECT_EQ(protocol.imeCounter(), 7);
    EXPECT_EQ(protocol.fieldCounter(), 9);

    auto text = protocol.textCommand("cats");
    EXPECT_EQ(text.remote_ime_batch_edit().ime_counter(), 7);
    EXPECT_EQ(text.remote_ime_batch_edit().field_counter(), 9);
}

TEST(RemoteProtocolTest, PowerOffReportedThroughStart) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);
    auto step = protocol.onMessage(deviceStart(false));
    EXPECT_FALSE(step.started);
    EXPECT_FALSE(protocol.isOn());
    ASSERT_EQ(step.updates.size(), 1u);
    EXPECT_EQ(step.updates[0], StatusField::IsOn);
}

TEST(RemoteProtocolTest, UnhandledKindIgnored) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    completeHandshake(protocol);
    RemoteMessage adjust;
    adjust.mutable_remote_adjust_volume_level();
    auto step = protocol.onMessage(adjust);
    EXPECT_TRUE(step.replies.empty());
    EXPECT_TRUE(step.updates.empty());
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------
TEST(RemoteProtocolTest, CommandsRequireStartedSession) {
    RemoteProtocol protocol{RemoteDeviceConfig{}};
    protocol.beginHandshake();
    protocol.onMessage(deviceConfigure(639));
    EXPECT_THROW(protocol.keyCommand({remote::KEYCODE_POWER, Messages::KeyDirection::SHORT}),
                 NotConnectedError);
    EXPECT_THROW(protocol.textCommand("x"), NotConnectedError);
    EXPECT_THROW(protocol.appLinkCommand("https://www.netflix.com/title"), NotConnectedError);

    protocol.onMessage(deviceSetActive());
    protocol.onMessage(deviceStart(true));
    auto key = protocol.keyCommand({remote::KEYCODE_POWER, Messages::KeyDirection::SHORT});
    EXPECT_EQ(key.remote_key_inject().key_code(), remote::KEYCODE_POWER);
    auto link = protocol.appLinkCommand("https://www.netflix.com/title");
    EXPECT_EQ(link.remote_app_link_launch_request().app_link(), "https://www.netflix.com/title");
}

// ---------------------------------------------------------------------------
// Keep-alive deadline
// ---------------------------------------------------------------------------
TEST(KeepAliveManagerTest, FiresAfterSilence) {
    boost::asio::io_context ioc;
    int died = 0;
    auto keepAlive = std::make_shared<KeepAliveManager>(ioc.get_executor(), 50ms, [&]() { died++; });
    auto started = std::chrono::steady_clock::now();
    keepAlive->start();
    ioc.run_for(1s);

    EXPECT_EQ(died, 1);
    EXPECT_FALSE(keepAlive->is_running());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 50ms);
}

TEST(KeepAliveManagerTest, TrafficPostponesDeadline) {
    boost::asio::io_context ioc;
    int died = 0;
    auto keepAlive = std::make_shared<KeepAliveManager>(ioc.get_executor(), 150ms, [&]() { died++; });
    keepAlive->start();

    // Traffic every 50 ms for 400 ms, well past one timeout.
    boost::asio::steady_timer pinger(ioc);
    int pings = 0;
    std::function<void(const boost::system::error_code &)> ping;
    ping = [&](const boost::system::error_code &ec) {
        if (ec || ++pings > 8) return;
        keepAlive->traffic_received();
        pinger.expires_after(50ms);
        pinger.async_wait(ping);
    };
    pinger.expires_after(50ms);
    pinger.async_wait(ping);

    ioc.run_for(400ms);
    EXPECT_EQ(died, 0);
    EXPECT_TRUE(keepAlive->is_running());

    // Pings stopped: the deadline follows within one timeout.
    ioc.restart();
    ioc.run_for(1s);
    EXPECT_EQ(died, 1);
}

TEST(KeepAliveManagerTest, StopCancelsDeadline) {
    boost::asio::io_context ioc;
    int died = 0;
    auto keepAlive = std::make_shared<KeepAliveManager>(ioc.get_executor(), 50ms, [&]() { died++; });
    keepAlive->start();
    keepAlive->stop();
    ioc.run_for(200ms);
    EXPECT_EQ(died, 0);
    EXPECT_FALSE(keepAlive->is_running());
}

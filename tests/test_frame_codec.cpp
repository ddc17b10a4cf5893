// =============================================================================
// Unit tests for frameCodec.hpp and messages.hpp
// Tests: varint prefix, incremental decoding, limits, message kinds, builders,
//        every message arm through a frame
// =============================================================================
#include <gtest/gtest.h>

#include "frameCodec.hpp"
#include "messages.hpp"

using namespace AndroidTV;
using namespace AndroidTV::Codec;

namespace {
std::vector<uint8_t> bytesOf(const google::protobuf::MessageLite &message) {
    auto s = message.SerializeAsString();
    return {s.begin(), s.end()};
}
} // namespace

// ---------------------------------------------------------------------------
// Varint prefix
// ---------------------------------------------------------------------------
TEST(VarintTest, SingleByteBelow128) {
    std::vector<uint8_t> out;
    appendVarint(out, 127);
    EXPECT_EQ(out, (std::vector<uint8_t>{0x7F}));
}

TEST(VarintTest, MultiByteLittleEndianGroups) {
    std::vector<uint8_t> out;
    appendVarint(out, 300);
    EXPECT_EQ(out, (std::vector<uint8_t>{0xAC, 0x02}));
}

TEST(FrameCodecTest, EncodeFramePrependsLength) {
    std::vector<uint8_t> payload(200, 0x42);
    auto frame = encodeFrame(payload);
    ASSERT_EQ(frame.size(), 202u);
    EXPECT_EQ(frame[0], 0xC8);
    EXPECT_EQ(frame[1], 0x01);
    EXPECT_EQ(decodeFrame(frame), payload);
}

TEST(FrameCodecTest, EmptyPayloadIsValidFrame) {
    auto frame = encodeFrame(std::vector<uint8_t>{});
    EXPECT_EQ(frame, (std::vector<uint8_t>{0x00}));
    EXPECT_TRUE(decodeFrame(frame).empty());
}

// ---------------------------------------------------------------------------
// Incremental decoding
// ---------------------------------------------------------------------------
TEST(FrameDecoderTest, ByteByByteFeed) {
    auto message = Messages::makeKeyInject({remote::KEYCODE_POWER, Messages::KeyDirection::SHORT});
    auto frame = encodeFrame(message);

    FrameDecoder decoder;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        decoder.feed(&frame[i], 1);
        EXPECT_FALSE(decoder.next().has_value()) << "at byte " << i;
        EXPECT_TRUE(decoder.hasPartialFrame());
    }
    decoder.feed(&frame.back(), 1);
    auto payload = decoder.next();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, bytesOf(message));
    EXPECT_FALSE(decoder.hasPartialFrame());
    EXPECT_NO_THROW(decoder.finish());
}

TEST(FrameDecoderTest, SeveralFramesInOneRead) {
    std::vector<uint8_t> stream;
    auto a = encodeFrame(Messages::makePingResponse(7));
    auto b = encodeFrame(Messages::makeSetActive(622));
    auto c = encodeFrame(Messages::makeAppLinkLaunch("https://www.youtube.com"));
    stream.insert(stream.end(), a.begin(), a.end());
    stream.insert(stream.end(), b.begin(), b.end());
    stream.insert(stream.end(), c.begin(), c.end());

    FrameDecoder decoder;
    decoder.feed(stream);
    auto first = decoder.next();
    auto second = decoder.next();
    auto third = decoder.next();
    ASSERT_TRUE(first && second && third);
    EXPECT_FALSE(decoder.next().has_value());

    EXPECT_EQ(decodeMessage<Messages::RemoteMessage>(*first).remote_ping_response().val1(), 7);
    EXPECT_EQ(decodeMessage<Messages::RemoteMessage>(*second).remote_set_active().active(), 622);
    EXPECT_EQ(decodeMessage<Messages::RemoteMessage>(*third).remote_app_link_launch_request().app_link(),
              "https://www.youtube.com");
}

TEST(FrameDecoderTest, TruncatedStreamFailsOnFinish) {
    auto frame = encodeFrame(Messages::makePairingRequest("atvremote", "client"));
    FrameDecoder decoder;
    decoder.feed(frame.data(), frame.size() - 3);
    EXPECT_FALSE(decoder.next().has_value());
    EXPECT_THROW(decoder.finish(), FramingError);
}

TEST(FrameDecoderTest, OverlongPrefixRejected) {
    std::vector<uint8_t> bad{0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
    FrameDecoder decoder;
    decoder.feed(bad);
    EXPECT_THROW(decoder.next(), FramingError);
}

TEST(FrameDecoderTest, FrameAboveLimitRejected) {
    std::vector<uint8_t> prefix;
    appendVarint(prefix, 4096);
    FrameDecoder decoder(1024);
    decoder.feed(prefix);
    EXPECT_THROW(decoder.next(), FramingError);
}

TEST(FrameCodecTest, DecodeFrameRejectsTrailingBytes) {
    auto frame = encodeFrame(std::vector<uint8_t>{1, 2, 3});
    frame.push_back(0x09);
    EXPECT_THROW(decodeFrame(frame), FramingError);
}

TEST(FrameCodecTest, TruncationAtAnyBoundaryFails) {
    auto frame = encodeFrame(Messages::makeSecret(std::vector<uint8_t>(32, 0xAB)));
    for (size_t cut = 0; cut < frame.size(); ++cut) {
        std::vector<uint8_t> partial(frame.begin(), frame.begin() + cut);
        EXPECT_THROW(decodeFrame(partial), FramingError) << "cut at " << cut;
    }
}

TEST(FrameCodecTest, GarbagePayloadIsFramingError) {
    std::vector<uint8_t> garbage{0xFF, 0xFF, 0xFF};
    EXPECT_THROW(decodeMessage<Messages::OuterMessage>(garbage), FramingError);
}

// ---------------------------------------------------------------------------
// Message kinds and builders
// ---------------------------------------------------------------------------
TEST(MessagesTest, PairingBuildersCarryVersionAndStatus) {
    auto request = Messages::makePairingRequest("atvremote", "My Phone");
    EXPECT_EQ(request.protocol_version(), Messages::kPairingProtocolVersion);
    EXPECT_EQ(request.status(), Messages::OuterMessage::STATUS_OK);
    EXPECT_EQ(Messages::kindOf(request), Messages::PairingMessageKind::PairingRequest);
    EXPECT_EQ(request.pairing_request().service_name(), "atvremote");
    EXPECT_EQ(request.pairing_request().client_name(), "My Phone");
}

TEST(MessagesTest, OptionsAdvertiseHexInputAndInputRole) {
    auto options = Messages::makeOptions({PairingEncoding{}});
    ASSERT_EQ(Messages::kindOf(options), Messages::PairingMessageKind::Options);
    ASSERT_EQ(options.options().input_encodings_size(), 1);
    EXPECT_EQ(options.options().input_encodings(0).type(),
              polo::wire::protobuf::Options::Encoding::ENCODING_TYPE_HEXADECIMAL);
    EXPECT_EQ(options.options().input_encodings(0).symbol_length(), 6u);
    EXPECT_EQ(options.options().preferred_role(), polo::wire::protobuf::Options::ROLE_TYPE_INPUT);
}

TEST(MessagesTest, KeyDirectionsMapToWire) {
    auto down = Messages::makeKeyInject({remote::KEYCODE_DPAD_UP, Messages::KeyDirection::DOWN});
    auto up = Messages::makeKeyInject({remote::KEYCODE_DPAD_UP, Messages::KeyDirection::UP});
    auto tap = Messages::makeKeyInject({remote::KEYCODE_DPAD_UP, Messages::KeyDirection::SHORT});
    EXPECT_EQ(down.remote_key_inject().direction(), remote::START_LONG);
    EXPECT_EQ(up.remote_key_inject().direction(), remote::END_LONG);
    EXPECT_EQ(tap.remote_key_inject().direction(), remote::SHORT);
    EXPECT_EQ(tap.remote_key_inject().key_code(), remote::KEYCODE_DPAD_UP);
    EXPECT_EQ(Messages::kindOf(tap), Messages::RemoteMessageKind::KeyInject);
}

TEST(MessagesTest, ConfigureAdvertisesClientDevice) {
    RemoteDeviceConfig device;
    auto configure = Messages::makeConfigure(639, device);
    EXPECT_EQ(configure.remote_configure().code1(), 639);
    EXPECT_EQ(configure.remote_configure().device_info().package_name(), "atvremote");
    EXPECT_EQ(configure.remote_configure().device_info().app_version(), "1.0.0");
    EXPECT_EQ(configure.remote_configure().device_info().unknown1(), 1);
    EXPECT_EQ(configure.remote_configure().device_info().unknown2(), "1");
}

TEST(MessagesTest, ImeBatchEditPlacesCursorAtEnd) {
    auto edit = Messages::makeImeBatchEdit(3, 5, "hello");
    const auto &batch = edit.remote_ime_batch_edit();
    EXPECT_EQ(batch.ime_counter(), 3);
    EXPECT_EQ(batch.field_counter(), 5);
    ASSERT_EQ(batch.edit_info_size(), 1);
    EXPECT_EQ(batch.edit_info(0).text_field_status().value(), "hello");
    EXPECT_EQ(batch.edit_info(0).text_field_status().start(), 4);
    EXPECT_EQ(batch.edit_info(0).text_field_status().end(), 4);
}

TEST(MessagesTest, UnknownRemoteMessageKind) {
    Messages::RemoteMessage empty;
    EXPECT_EQ(Messages::kindOf(empty), Messages::RemoteMessageKind::Unknown);
}

// ---------------------------------------------------------------------------
// Every message arm survives framing
// ---------------------------------------------------------------------------
namespace {
template <typename T> T throughFrame(const T &message) {
    return decodeMessage<T>(decodeFrame(encodeFrame(message)));
}
} // namespace

TEST(MessageRoundTripTest, EveryPairingArm) {
    PairingEncoding numeric{PairingEncoding::Type::NUMERIC, 4};
    std::vector<std::pair<Messages::OuterMessage, Messages::PairingMessageKind>> cases = {
        {Messages::makePairingRequest("atvremote", "Living Room"),
         Messages::PairingMessageKind::PairingRequest},
        {Messages::makePairingRequestAck("SHIELD"), Messages::PairingMessageKind::PairingRequestAck},
        {Messages::makeOptions({PairingEncoding{}, numeric}), Messages::PairingMessageKind::Options},
        {Messages::makeConfiguration(PairingEncoding{}), Messages::PairingMessageKind::Configuration},
        {Messages::makeConfigurationAck(), Messages::PairingMessageKind::ConfigurationAck},
        {Messages::makeSecret({0x00, 0x7F, 0x80, 0xFF}), Messages::PairingMessageKind::Secret},
        {Messages::makeSecretAck({0xDE, 0xAD}), Messages::PairingMessageKind::SecretAck},
    };
    for (const auto &[message, kind] : cases) {
        SCOPED_TRACE(std::string(Messages::toString(kind)));
        ASSERT_EQ(Messages::kindOf(message), kind);
        auto decoded = throughFrame(message);
        EXPECT_EQ(decoded.SerializeAsString(), message.SerializeAsString());
        EXPECT_EQ(Messages::kindOf(decoded), kind);
    }
}

TEST(MessageRoundTripTest, EveryRemoteArm) {
    using Kind = Messages::RemoteMessageKind;
    std::vector<std::pair<Messages::RemoteMessage, Kind>> cases;

    cases.emplace_back(Messages::makeConfigure(622, RemoteDeviceConfig{}), Kind::Configure);
    cases.emplace_back(Messages::makeSetActive(622), Kind::SetActive);
    {
        Messages::RemoteMessage m;
        auto *error = m.mutable_remote_error();
        error->set_value(true);
        error->mutable_message()->mutable_remote_set_active()->set_active(1);
        cases.emplace_back(m, Kind::Error);
    }
    {
        Messages::RemoteMessage m;
        m.mutable_remote_ping_request()->set_val1(7);
        m.mutable_remote_ping_request()->set_val2(-3);
        cases.emplace_back(m, Kind::PingRequest);
    }
    cases.emplace_back(Messages::makePingResponse(7), Kind::PingResponse);
    cases.emplace_back(Messages::makeKeyInject({remote::KEYCODE_MEDIA_PLAY_PAUSE, Messages::KeyDirection::DOWN}),
                       Kind::KeyInject);
    {
        Messages::RemoteMessage m;
        auto *inject = m.mutable_remote_ime_key_inject();
        inject->mutable_app_info()->set_counter(5);
        inject->mutable_app_info()->set_app_package("com.netflix.ninja");
        inject->mutable_text_field_status()->set_counter_field(6);
        inject->mutable_text_field_status()->set_value("stranger");
        inject->mutable_text_field_status()->set_start(8);
        inject->mutable_text_field_status()->set_end(8);
        cases.emplace_back(m, Kind::ImeKeyInject);
    }
    cases.emplace_back(Messages::makeImeBatchEdit(5, 6, "héllo"), Kind::ImeBatchEdit);
    {
        Messages::RemoteMessage m;
        auto *field = m.mutable_remote_ime_show_request()->mutable_remote_text_field_status();
        field->set_counter_field(2);
        field->set_label("Search");
        cases.emplace_back(m, Kind::ImeShowRequest);
    }
    {
        Messages::RemoteMessage m;
        m.mutable_remote_start()->set_started(true);
        cases.emplace_back(m, Kind::Start);
    }
    {
        Messages::RemoteMessage m;
        auto *volume = m.mutable_remote_set_volume_level();
        volume->set_volume_max(100);
        volume->set_volume_level(42);
        volume->set_volume_muted(true);
        volume->set_player_model("SHIELD");
        cases.emplace_back(m, Kind::SetVolumeLevel);
    }
    {
        Messages::RemoteMessage m;
        m.mutable_remote_adjust_volume_level();
        cases.emplace_back(m, Kind::AdjustVolumeLevel);
    }
    cases.emplace_back(Messages::makeAppLinkLaunch("https://www.netflix.com/title/80057281"),
                       Kind::AppLinkLaunchRequest);

    for (const auto &[message, kind] : cases) {
        SCOPED_TRACE(std::string(Messages::toString(kind)));
        ASSERT_EQ(Messages::kindOf(message), kind);
        auto decoded = throughFrame(message);
        EXPECT_EQ(decoded.SerializeAsString(), message.SerializeAsString());
        EXPECT_EQ(Messages::kindOf(decoded), kind);
    }
}

// =============================================================================
// Unit tests for ATVConfig.hpp
// Tests: defaults, JSON parsing, validation errors, file loading
// =============================================================================
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "ATVConfig.hpp"
#include "ATVErrors.hpp"

using namespace AndroidTV;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static std::filesystem::path writeTmpJson(const std::string &name, const std::string &content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path);
    f << content;
    return path;
}

TEST(ConfigTest, DefaultValues) {
    ClientConfig cfg;
    EXPECT_EQ(cfg.clientName, "atvremote");
    EXPECT_EQ(cfg.serviceName, "atvremote");
    EXPECT_EQ(cfg.pairingPort, 6467);
    EXPECT_EQ(cfg.controlPort, 6466);
    EXPECT_FALSE(cfg.strictPinning);
    EXPECT_EQ(cfg.timeouts.keepAlive, 16000ms);
    EXPECT_EQ(cfg.timeouts.pairingStep, 30000ms);
    EXPECT_FALSE(cfg.reconnect.enabled);
    EXPECT_EQ(cfg.reconnect.initialDelay, 10s);
    EXPECT_EQ(cfg.reconnect.maxDelay, 300s);
    EXPECT_EQ(cfg.device.featureMask, 622);
    ASSERT_EQ(cfg.pairing.encodings.size(), 1u);
    EXPECT_EQ(cfg.pairing.encodings[0].type, PairingEncoding::Type::HEXADECIMAL);
    EXPECT_EQ(cfg.pairing.encodings[0].symbolLength, 6u);
}

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto cfg = parseConfig("{}");
    EXPECT_EQ(cfg.controlPort, 6466);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(ConfigTest, ParsesAllSections) {
    auto cfg = parseConfig(R"({
        "client_name": "Kitchen Remote",
        "storage_path": "/var/lib/atv",
        "control_port": 7466,
        "strict_pinning": true,
        "log_level": "debug",
        "timeouts": {"keep_alive_ms": 8000, "session_handshake_ms": 5000},
        "reconnect": {"enabled": true, "initial_delay_ms": 2000, "max_delay_ms": 60000},
        "device": {"feature_mask": 639, "package_name": "kitchen"},
        "pairing": {"encodings": [{"type": "hexadecimal", "symbol_length": 8}]},
        "some_future_key": [1, 2, 3]
    })");
    EXPECT_EQ(cfg.clientName, "Kitchen Remote");
    EXPECT_EQ(cfg.storagePath, std::filesystem::path("/var/lib/atv"));
    EXPECT_EQ(cfg.controlPort, 7466);
    EXPECT_EQ(cfg.pairingPort, 6467);
    EXPECT_TRUE(cfg.strictPinning);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.timeouts.keepAlive, 8000ms);
    EXPECT_EQ(cfg.timeouts.sessionHandshake, 5000ms);
    EXPECT_EQ(cfg.timeouts.connect, 10000ms);
    EXPECT_TRUE(cfg.reconnect.enabled);
    EXPECT_EQ(cfg.reconnect.initialDelay, 2000ms);
    EXPECT_EQ(cfg.reconnect.maxDelay, 60000ms);
    EXPECT_EQ(cfg.device.featureMask, 639);
    EXPECT_EQ(cfg.device.packageName, "kitchen");
    EXPECT_EQ(cfg.device.appVersion, "1.0.0");
    ASSERT_EQ(cfg.pairing.encodings.size(), 1u);
    EXPECT_EQ(cfg.pairing.encodings[0].symbolLength, 8u);
}

TEST(ConfigTest, MalformedJsonThrows) {
    EXPECT_THROW(parseConfig("{\"client_name\": "), ConfigError);
    EXPECT_THROW(parseConfig("[1, 2]"), ConfigError);
}

TEST(ConfigTest, WrongTypeThrows) {
    EXPECT_THROW(parseConfig(R"({"control_port": "6466"})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"timeouts": 5})"), ConfigError);
}

TEST(ConfigTest, UnknownEncodingThrows) {
    EXPECT_THROW(parseConfig(R"({"pairing": {"encodings": [{"type": "morse"}]}})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"pairing": {"encodings": []}})"), ConfigError);
}

TEST(ConfigTest, UnknownLogLevelThrows) {
    EXPECT_THROW(parseConfig(R"({"log_level": "chatty"})"), ConfigError);
}

TEST(ConfigTest, InconsistentReconnectDelaysThrow) {
    EXPECT_THROW(parseConfig(R"({"reconnect": {"initial_delay_ms": 5000, "max_delay_ms": 1000}})"),
                 ConfigError);
}

TEST(ConfigTest, NonPositiveTimeoutsThrow) {
    EXPECT_THROW(parseConfig(R"({"timeouts": {"connect_ms": 0}})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"timeouts": {"tls_handshake_ms": -1}})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"timeouts": {"pairing_step_ms": 0}})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"timeouts": {"session_handshake_ms": -500}})"), ConfigError);
    EXPECT_THROW(parseConfig(R"({"timeouts": {"keep_alive_ms": 0}})"), ConfigError);
    EXPECT_NO_THROW(parseConfig(R"({"timeouts": {"keep_alive_ms": 1}})"));
}

TEST(ConfigTest, ZeroMaxFrameSizeThrows) {
    EXPECT_THROW(parseConfig(R"({"max_frame_size": 0})"), ConfigError);
    EXPECT_EQ(parseConfig(R"({"max_frame_size": 1024})").maxFrameSize, 1024u);
}

TEST(ConfigTest, ConfigErrorCarriesCategory) {
    try {
        parseConfig("not json");
        FAIL() << "expected ConfigError";
    } catch (const Error &e) {
        EXPECT_EQ(e.code(), make_error_code(errc::config_error));
        EXPECT_EQ(&e.code().category(), &atv_category());
    }
}

TEST(ConfigTest, LoadConfigFromFile) {
    auto path = writeTmpJson("atv_test_config.json", R"({"service_name": "svc", "pairing_port": 7467})");
    auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.serviceName, "svc");
    EXPECT_EQ(cfg.pairingPort, 7467);
    std::filesystem::remove(path);
}

TEST(ConfigTest, LoadConfigMissingFileThrows) {
    EXPECT_THROW(loadConfig("__nonexistent_atv_config_xyz.json"), ConfigError);
}

TEST(ConfigTest, EncodingNamesRoundTrip) {
    EXPECT_EQ(encodingTypeFromString("hexadecimal"), PairingEncoding::Type::HEXADECIMAL);
    EXPECT_EQ(toString(PairingEncoding::Type::NUMERIC), "numeric");
    EXPECT_FALSE(encodingTypeFromString("HEX").has_value());
}

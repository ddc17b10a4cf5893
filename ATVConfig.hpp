#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace AndroidTV {

struct PairingEncoding {
    enum class Type {
      ALPHANUMERIC = 1,
      NUMERIC = 2,
      HEXADECIMAL = 3,
      QRCODE = 4
    };
    Type type = Type::HEXADECIMAL;
    uint32_t symbolLength = 6;

    bool operator==(const PairingEncoding &) const = default;
};

std::string_view toString(PairingEncoding::Type type);
std::optional<PairingEncoding::Type> encodingTypeFromString(std::string_view name);

struct TimeoutConfig {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds tlsHandshake{10000};
    // Applies to every pairing round trip. The wait for the user code is not bounded.
    std::chrono::milliseconds pairingStep{30000};
    // From TLS established until remote_start.
    std::chrono::milliseconds sessionHandshake{15000};
    // The device pings every 5 seconds.
    std::chrono::milliseconds keepAlive{16000};
};

struct ReconnectConfig {
    bool enabled = false;
    std::chrono::milliseconds initialDelay{10000};
    std::chrono::milliseconds maxDelay{300000};
};

struct RemoteDeviceConfig {
    int32_t featureMask = 622;
    std::string packageName = "atvremote";
    std::string appVersion = "1.0.0";
};

struct PairingConfig {
    // In order of preference
    std::vector<PairingEncoding> encodings{PairingEncoding{}};
};

struct ClientConfig {
    // Shown on the TV while pairing, also the certificate CN
    std::string clientName = "atvremote";
    std::string serviceName = "atvremote";
    std::filesystem::path storagePath = ".";
    uint16_t pairingPort = 6467;
    uint16_t controlPort = 6466;
    size_t maxFrameSize = 64 * 1024;
    // Treat a fingerprint that differs from the paired one as TrustChangedError
    bool strictPinning = false;
    std::string logLevel = "info";

    TimeoutConfig timeouts;
    ReconnectConfig reconnect;
    RemoteDeviceConfig device;
    PairingConfig pairing;
};

// Missing keys keep their defaults, unknown keys are ignored.
// Throws ConfigError on unreadable files, malformed JSON or wrong value types.
ClientConfig loadConfig(const std::filesystem::path &path);
ClientConfig parseConfig(std::string_view json);

} // namespace AndroidTV

#ifndef ATV_MESSAGES_HPP
#define ATV_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ATVConfig.hpp"
#include "polo.pb.h"
#include "remotemessage.pb.h"

namespace AndroidTV {
namespace Messages {

using OuterMessage = polo::wire::protobuf::OuterMessage;
using RemoteMessage = remote::RemoteMessage;

static constexpr uint32_t kPairingProtocolVersion = 2;

enum class PairingMessageKind {
  Unknown,
  PairingRequest,
  PairingRequestAck,
  Options,
  Configuration,
  ConfigurationAck,
  Secret,
  SecretAck
};

enum class RemoteMessageKind {
  Unknown,
  Configure,
  SetActive,
  Error,
  PingRequest,
  PingResponse,
  KeyInject,
  ImeKeyInject,
  ImeBatchEdit,
  ImeShowRequest,
  Start,
  SetVolumeLevel,
  AdjustVolumeLevel,
  AppLinkLaunchRequest
};

// First populated field wins. A well-formed message carries exactly one.
PairingMessageKind kindOf(const OuterMessage &message);
RemoteMessageKind kindOf(const RemoteMessage &message);

std::string_view toString(PairingMessageKind kind);
std::string_view toString(RemoteMessageKind kind);

enum class KeyDirection { DOWN, UP, SHORT };

struct KeyCommand {
    int32_t keyCode = remote::KEYCODE_UNKNOWN;
    KeyDirection direction = KeyDirection::SHORT;
};

remote::RemoteDirection toWire(KeyDirection direction);
std::string_view toString(KeyDirection direction);

polo::wire::protobuf::Options::Encoding toWire(const PairingEncoding &encoding);
std::optional<PairingEncoding> fromWire(const polo::wire::protobuf::Options::Encoding &encoding);

// --- Pairing channel, client side ---
OuterMessage makePairingRequest(const std::string &serviceName, const std::string &clientName);
OuterMessage makeOptions(const std::vector<PairingEncoding> &inputEncodings);
OuterMessage makeConfiguration(const PairingEncoding &encoding);
OuterMessage makeSecret(const std::vector<uint8_t> &secret);

// --- Pairing channel, device side ---
OuterMessage makePairingRequestAck(const std::string &serverName);
OuterMessage makeConfigurationAck();
OuterMessage makeSecretAck(const std::vector<uint8_t> &secret);
OuterMessage makeStatus(OuterMessage::Status status);

// --- Control channel, client side ---
RemoteMessage makeConfigure(int32_t featureMask, const RemoteDeviceConfig &device);
RemoteMessage makeSetActive(int32_t featureMask);
RemoteMessage makePingResponse(int32_t val1);
RemoteMessage makeKeyInject(const KeyCommand &command);
// Replaces the focused text field content with text.
RemoteMessage makeImeBatchEdit(int32_t imeCounter, int32_t fieldCounter, const std::string &text);
RemoteMessage makeAppLinkLaunch(const std::string &appLink);

} // namespace Messages
} // namespace AndroidTV

#endif // ATV_MESSAGES_HPP

#include "messages.hpp"

namespace AndroidTV {
namespace Messages {

using polo::wire::protobuf::Options;

namespace {
OuterMessage makeOuter() {
    OuterMessage message;
    message.set_protocol_version(kPairingProtocolVersion);
    message.set_status(OuterMessage::STATUS_OK);
    return message;
}
} // namespace

PairingMessageKind kindOf(const OuterMessage &message) {
    if (message.has_pairing_request()) return PairingMessageKind::PairingRequest;
    if (message.has_pairing_request_ack()) return PairingMessageKind::PairingRequestAck;
    if (message.has_options()) return PairingMessageKind::Options;
    if (message.has_configuration()) return PairingMessageKind::Configuration;
    if (message.has_configuration_ack()) return PairingMessageKind::ConfigurationAck;
    if (message.has_secret()) return PairingMessageKind::Secret;
    if (message.has_secret_ack()) return PairingMessageKind::SecretAck;
    return PairingMessageKind::Unknown;
}

RemoteMessageKind kindOf(const RemoteMessage &message) {
    if (message.has_remote_configure()) return RemoteMessageKind::Configure;
    if (message.has_remote_set_active()) return RemoteMessageKind::SetActive;
    if (message.has_remote_error()) return RemoteMessageKind::Error;
    if (message.has_remote_ping_request()) return RemoteMessageKind::PingRequest;
    if (message.has_remote_ping_response()) return RemoteMessageKind::PingResponse;
    if (message.has_remote_key_inject()) return RemoteMessageKind::KeyInject;
    if (message.has_remote_ime_key_inject()) return RemoteMessageKind::ImeKeyInject;
    if (message.has_remote_ime_batch_edit()) return RemoteMessageKind::ImeBatchEdit;
    if (message.has_remote_ime_show_request()) return RemoteMessageKind::ImeShowRequest;
    if (message.has_remote_start()) return RemoteMessageKind::Start;
    if (message.has_remote_set_volume_level()) return RemoteMessageKind::SetVolumeLevel;
    if (message.has_remote_adjust_volume_level()) return RemoteMessageKind::AdjustVolumeLevel;
    if (message.has_remote_app_link_launch_request()) return RemoteMessageKind::AppLinkLaunchRequest;
    return RemoteMessageKind::Unknown;
}

std::string_view toString(PairingMessageKind kind) {
    switch (kind) {
        case PairingMessageKind::PairingRequest: return "pairing_request";
        case PairingMessageKind::PairingRequestAck: return "pairing_request_ack";
        case PairingMessageKind::Options: return "options";
        case PairingMessageKind::Configuration: return "configuration";
        case PairingMessageKind::ConfigurationAck: return "configuration_ack";
        case PairingMessageKind::Secret: return "secret";
        case PairingMessageKind::SecretAck: return "secret_ack";
        case PairingMessageKind::Unknown: break;
    }
    return "unknown";
}

std::string_view toString(RemoteMessageKind kind) {
    switch (kind) {
        case RemoteMessageKind::Configure: return "remote_configure";
        case RemoteMessageKind::SetActive: return "remote_set_active";
        case RemoteMessageKind::Error: return "remote_error";
        case RemoteMessageKind::PingRequest: return "remote_ping_request";
        case RemoteMessageKind::PingResponse: return "remote_ping_response";
        case RemoteMessageKind::KeyInject: return "remote_key_inject";
        case RemoteMessageKind::ImeKeyInject: return "remote_ime_key_inject";
        case RemoteMessageKind::ImeBatchEdit: return "remote_ime_batch_edit";
        case RemoteMessageKind::ImeShowRequest: return "remote_ime_show_request";
        case RemoteMessageKind::Start: return "remote_start";
        case RemoteMessageKind::SetVolumeLevel: return "remote_set_volume_level";
        case RemoteMessageKind::AdjustVolumeLevel: return "remote_adjust_volume_level";
        case RemoteMessageKind::AppLinkLaunchRequest: return "remote_app_link_launch_request";
        case RemoteMessageKind::Unknown: break;
    }
    return "unknown";
}

remote::RemoteDirection toWire(KeyDirection direction) {
    switch (direction) {
        case KeyDirection::DOWN: return remote::START_LONG;
        case KeyDirection::UP: return remote::END_LONG;
        case KeyDirection::SHORT: return remote::SHORT;
    }
    return remote::SHORT;
}

std::string_view toString(KeyDirection direction) {
    switch (direction) {
        case KeyDirection::DOWN: return "DOWN";
        case KeyDirection::UP: return "UP";
        case KeyDirection::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

Options::Encoding toWire(const PairingEncoding &encoding) {
    Options::Encoding wire;
    wire.set_type(static_cast<Options::Encoding::EncodingType>(encoding.type));
    wire.set_symbol_length(encoding.symbolLength);
    return wire;
}

std::optional<PairingEncoding> fromWire(const Options::Encoding &encoding) {
    switch (encoding.type()) {
        case Options::Encoding::ENCODING_TYPE_ALPHANUMERIC:
        case Options::Encoding::ENCODING_TYPE_NUMERIC:
        case Options::Encoding::ENCODING_TYPE_HEXADECIMAL:
        case Options::Encoding::ENCODING_TYPE_QRCODE:
            return PairingEncoding{static_cast<PairingEncoding::Type>(encoding.type()),
                                   encoding.symbol_length()};
        default:
            return std::nullopt;
    }
}

OuterMessage makePairingRequest(const std::string &serviceName, const std::string &clientName) {
    auto message = makeOuter();
    auto *request = message.mutable_pairing_request();
    request->set_service_name(serviceName);
    request->set_client_name(clientName);
    return message;
}

OuterMessage makeOptions(const std::vector<PairingEncoding> &inputEncodings) {
    auto message = makeOuter();
    auto *options = message.mutable_options();
    for (const auto &encoding : inputEncodings) {
        *options->add_input_encodings() = toWire(encoding);
    }
    options->set_preferred_role(Options::ROLE_TYPE_INPUT);
    return message;
}

OuterMessage makeConfiguration(const PairingEncoding &encoding) {
    auto message = makeOuter();
    auto *configuration = message.mutable_configuration();
    *configuration->mutable_encoding() = toWire(encoding);
    configuration->set_client_role(Options::ROLE_TYPE_INPUT);
    return message;
}

OuterMessage makeSecret(const std::vector<uint8_t> &secret) {
    auto message = makeOuter();
    message.mutable_secret()->set_secret(secret.data(), secret.size());
    return message;
}

OuterMessage makePairingRequestAck(const std::string &serverName) {
    auto message = makeOuter();
    message.mutable_pairing_request_ack()->set_server_name(serverName);
    return message;
}

OuterMessage makeConfigurationAck() {
    auto message = makeOuter();
    message.mutable_configuration_ack();
    return message;
}

OuterMessage makeSecretAck(const std::vector<uint8_t> &secret) {
    auto message = makeOuter();
    message.mutable_secret_ack()->set_secret(secret.data(), secret.size());
    return message;
}

OuterMessage makeStatus(OuterMessage::Status status) {
    auto message = makeOuter();
    message.set_status(status);
    return message;
}

RemoteMessage makeConfigure(int32_t featureMask, const RemoteDeviceConfig &device) {
    RemoteMessage message;
    auto *configure = message.mutable_remote_configure();
    configure->set_code1(featureMask);
    auto *info = configure->mutable_device_info();
    info->set_unknown1(1);
    info->set_unknown2("1");
    info->set_package_name(device.packageName);
    info->set_app_version(device.appVersion);
    return message;
}

RemoteMessage makeSetActive(int32_t featureMask) {
    RemoteMessage message;
    message.mutable_remote_set_active()->set_active(featureMask);
    return message;
}

RemoteMessage makePingResponse(int32_t val1) {
    RemoteMessage message;
    message.mutable_remote_ping_response()->set_val1(val1);
    return message;
}

RemoteMessage makeKeyInject(const KeyCommand &command) {
    RemoteMessage message;
    auto *inject = message.mutable_remote_key_inject();
    inject->set_key_code(static_cast<remote::RemoteKeyCode>(command.keyCode));
    inject->set_direction(toWire(command.direction));
    return message;
}

RemoteMessage makeImeBatchEdit(int32_t imeCounter, int32_t fieldCounter, const std::string &text) {
    RemoteMessage message;
    auto *edit = message.mutable_remote_ime_batch_edit();
    edit->set_ime_counter(imeCounter);
    edit->set_field_counter(fieldCounter);
    auto *info = edit->add_edit_info();
    info->set_insert(1);
    auto *status = info->mutable_text_field_status();
    // Cursor after the last character
    int32_t cursor = static_cast<int32_t>(text.size()) - 1;
    status->set_start(cursor);
    status->set_end(cursor);
    status->set_value(text);
    return message;
}

RemoteMessage makeAppLinkLaunch(const std::string &appLink) {
    RemoteMessage message;
    message.mutable_remote_app_link_launch_request()->set_app_link(appLink);
    return message;
}

} // namespace Messages
} // namespace AndroidTV

#include "remoteProtocol.hpp"
#include "ATVErrors.hpp"
#include "formatters.hpp"
#include "logger.hpp"

namespace AndroidTV {
namespace Remote {

using Messages::RemoteMessage;
using Messages::RemoteMessageKind;

std::string_view toString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::ConfiguringSession:
        return "ConfiguringSession";
    case ConnectionState::Connected:
        return "Connected";
    }
    return "Unknown";
}

std::string_view toString(StatusField field) {
    switch (field) {
    case StatusField::IsOn:
        return "is_on";
    case StatusField::CurrentApp:
        return "current_app";
    case StatusField::Volume:
        return "volume";
    case StatusField::DeviceInfo:
        return "device_info";
    }
    return "unknown";
}

RemoteProtocol::RemoteProtocol(RemoteDeviceConfig device)
    : device_(std::move(device)), activeMask_(device_.featureMask) {}

void RemoteProtocol::beginHandshake() {
    started_.store(false);
    activeMask_.store(device_.featureMask);
    isOn_.store(false);
    volumeLevel_.store(0);
    volumeMax_.store(0);
    volumeMuted_.store(false);
    imeCounter_.store(0);
    fieldCounter_.store(0);
    std::lock_guard lock(textMutex_);
    currentApp_.clear();
    deviceInfo_ = DeviceInfo{};
}

RemoteProtocol::Step RemoteProtocol::onMessage(const RemoteMessage &message) {
    Step step;
    auto kind = Messages::kindOf(message);
    bool started = started_.load();

    switch (kind) {
    case RemoteMessageKind::Configure: {
        const auto &configure = message.remote_configure();
        {
            std::lock_guard lock(textMutex_);
            deviceInfo_.manufacturer = configure.device_info().vendor();
            deviceInfo_.model = configure.device_info().model();
            deviceInfo_.softwareVersion = configure.device_info().app_version();
        }
        if (configure.code1() != 0) {
            activeMask_.store(configure.code1());
        }
        LOG_DEBUG("Device {} {} ({}), feature mask {}", configure.device_info().vendor(),
                  configure.device_info().model(), configure.device_info().app_version(),
                  activeMask_.load());
        step.replies.push_back(Messages::makeConfigure(activeMask_.load(), device_));
        if (started) {
            step.updates.push_back(StatusField::DeviceInfo);
        }
        break;
    }
    case RemoteMessageKind::SetActive:
        step.replies.push_back(Messages::makeSetActive(activeMask_.load()));
        break;
    case RemoteMessageKind::Start:
        isOn_.store(message.remote_start().started());
        if (!started) {
            started_.store(true);
            step.started = true;
            step.updates.push_back(StatusField::DeviceInfo);
        }
        step.updates.push_back(StatusField::IsOn);
        break;
    case RemoteMessageKind::PingRequest:
        step.keepAlive = true;
        step.replies.push_back(
            Messages::makePingResponse(message.remote_ping_request().val1()));
        break;
    case RemoteMessageKind::Error:
        if (!started) {
            throw HandshakeError(fmt::format("device rejected the configuration: {}",
                                             message.remote_error().message()));
        }
        LOG_WARN("Device reported an error: {}", message.remote_error());
        break;
    case RemoteMessageKind::ImeKeyInject: {
        if (!started) {
            LOG_DEBUG("Dropping {} before the session started", toString(kind));
            break;
        }
        const auto &inject = message.remote_ime_key_inject();
        imeCounter_.store(inject.app_info().counter());
        fieldCounter_.store(inject.text_field_status().counter_field());
        {
            std::lock_guard lock(textMutex_);
            currentApp_ = inject.app_info().app_package();
        }
        step.updates.push_back(StatusField::CurrentApp);
        break;
    }
    case RemoteMessageKind::SetVolumeLevel: {
        if (!started) {
            LOG_DEBUG("Dropping {} before the session started", toString(kind));
            break;
        }
        const auto &volume = message.remote_set_volume_level();
        volumeLevel_.store(static_cast<int32_t>(volume.volume_level()));
        volumeMax_.store(static_cast<int32_t>(volume.volume_max()));
        volumeMuted_.store(volume.volume_muted());
        step.updates.push_back(StatusField::Volume);
        break;
    }
    case RemoteMessageKind::ImeBatchEdit:
        if (!started) {
            LOG_DEBUG("Dropping {} before the session started", toString(kind));
            break;
        }
        imeCounter_.store(message.remote_ime_batch_edit().ime_counter());
        fieldCounter_.store(message.remote_ime_batch_edit().field_counter());
        break;
    case RemoteMessageKind::ImeShowRequest:
        if (!started) {
            LOG_DEBUG("Dropping {} before the session started", toString(kind));
            break;
        }
        fieldCounter_.store(
            message.remote_ime_show_request().remote_text_field_status().counter_field());
        break;
    default:
        LOG_DEBUG("Unhandled: {}", message);
        break;
    }
    return step;
}

VolumeInfo RemoteProtocol::volume() const {
    return VolumeInfo{volumeLevel_.load(), volumeMax_.load(), volumeMuted_.load()};
}

std::string RemoteProtocol::currentApp() const {
    std::lock_guard lock(textMutex_);
    return currentApp_;
}

DeviceInfo RemoteProtocol::deviceInfo() const {
    std::lock_guard lock(textMutex_);
    return deviceInfo_;
}

RemoteStatus RemoteProtocol::status() const {
    RemoteStatus status;
    status.isOn = isOn_.load();
    status.volume = volume();
    std::lock_guard lock(textMutex_);
    status.currentApp = currentApp_;
    status.device = deviceInfo_;
    return status;
}

void RemoteProtocol::requireStarted(std::string_view what) const {
    if (!started_.load()) {
        throw NotConnectedError(fmt::format("cannot send {}: session not started", what));
    }
}

RemoteMessage RemoteProtocol::keyCommand(const Messages::KeyCommand &command) const {
    requireStarted("key");
    return Messages::makeKeyInject(command);
}

RemoteMessage RemoteProtocol::textCommand(const std::string &text) const {
    requireStarted("text");
    return Messages::makeImeBatchEdit(imeCounter_.load(), fieldCounter_.load(), text);
}

RemoteMessage RemoteProtocol::appLinkCommand(const std::string &appLink) const {
    requireStarted("app link");
    return Messages::makeAppLinkLaunch(appLink);
}

} // namespace Remote
} // namespace AndroidTV

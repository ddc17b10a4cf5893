#ifndef ATV_REMOTE_PROTOCOL_HPP
#define ATV_REMOTE_PROTOCOL_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ATVConfig.hpp"
#include "messages.hpp"

namespace AndroidTV {
namespace Remote {

enum class ConnectionState { Disconnected, Connecting, ConfiguringSession, Connected };

std::string_view toString(ConnectionState state);

struct DeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string softwareVersion;

    bool operator==(const DeviceInfo &) const = default;
};

struct VolumeInfo {
    int32_t level = 0;
    int32_t max = 0;
    bool muted = false;

    bool operator==(const VolumeInfo &) const = default;
};

struct RemoteStatus {
    bool isOn = false;
    std::string currentApp;
    VolumeInfo volume;
    DeviceInfo device;
};

enum class StatusField { IsOn, CurrentApp, Volume, DeviceInfo };

std::string_view toString(StatusField field);

// Control channel message handling without I/O: the configuration exchange,
// ping answers, status bookkeeping and outbound command construction.
// onMessage() and beginHandshake() must be called from a single thread;
// the status accessors and command builders may be called from any thread.
class RemoteProtocol {
  public:
    struct Step {
        std::vector<Messages::RemoteMessage> replies;
        std::vector<StatusField> updates;
        bool started = false;   // the exchange completed with this message
        bool keepAlive = false; // ping traffic, logged at VERBOSE only
    };

    explicit RemoteProtocol(RemoteDeviceConfig device);

    // Forgets the previous connection: the exchange and every status field
    // go back to their defaults until the device reports again.
    void beginHandshake();

    // Throws HandshakeError when the device reports an error before the
    // exchange completes.
    Step onMessage(const Messages::RemoteMessage &message);

    bool isStarted() const { return started_.load(); }
    int32_t activeMask() const { return activeMask_.load(); }

    bool isOn() const { return isOn_.load(); }
    VolumeInfo volume() const;
    std::string currentApp() const;
    DeviceInfo deviceInfo() const;
    RemoteStatus status() const;
    int32_t imeCounter() const { return imeCounter_.load(); }
    int32_t fieldCounter() const { return fieldCounter_.load(); }

    // Throw NotConnectedError until the exchange has completed.
    Messages::RemoteMessage keyCommand(const Messages::KeyCommand &command) const;
    Messages::RemoteMessage textCommand(const std::string &text) const;
    Messages::RemoteMessage appLinkCommand(const std::string &appLink) const;

  private:
    void requireStarted(std::string_view what) const;

    RemoteDeviceConfig device_;

    std::atomic<bool> started_{false};
    std::atomic<int32_t> activeMask_;

    std::atomic<bool> isOn_{false};
    std::atomic<int32_t> volumeLevel_{0};
    std::atomic<int32_t> volumeMax_{0};
    std::atomic<bool> volumeMuted_{false};
    std::atomic<int32_t> imeCounter_{0};
    std::atomic<int32_t> fieldCounter_{0};

    mutable std::mutex textMutex_;
    std::string currentApp_;
    DeviceInfo deviceInfo_;
};

} // namespace Remote
} // namespace AndroidTV

#endif // ATV_REMOTE_PROTOCOL_HPP

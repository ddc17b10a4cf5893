#ifndef ATV_REMOTE_SESSION_HPP
#define ATV_REMOTE_SESSION_HPP

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "ATVConfig.hpp"
#include "ATVErrors.hpp"
#include "identityStore.hpp"
#include "keepAliveManager.hpp"
#include "remoteProtocol.hpp"
#include "tlsConnection.hpp"

namespace AndroidTV {
namespace Remote {

using ChannelConnectHandler =
    std::function<void(const error_code &ec, std::shared_ptr<Transport::MessageChannel> channel)>;
// Opens a channel to the control port. The returned channel is the
// in-progress connection; closing it aborts the attempt.
using ChannelFactory =
    std::function<std::shared_ptr<Transport::MessageChannel>(ChannelConnectHandler handler)>;

struct RemoteCallbacks {
    std::function<void(StatusField field, const RemoteStatus &status)> onStatusUpdate;
    std::function<void(ConnectionState state)> onStateChanged;
    // An established session was lost, or reconnecting ended with a terminal
    // error. Not invoked after stop().
    std::function<void(const error_code &ec)> onDisconnect;
    // The device no longer accepts this client. Reconnecting stops.
    std::function<void()> onInvalidAuth;
    // The device certificate differs from the one recorded at pairing.
    std::function<void(const std::string &expected, const std::string &actual)>
        onFingerprintChanged;
};

// Doubles delay, bounded by config.maxDelay.
std::chrono::milliseconds nextReconnectDelay(std::chrono::milliseconds delay,
                                             const ReconnectConfig &config);

// One remote control connection to a device, with optional reconnect. All
// work runs on the session strand; commands may be issued from any thread.
class RemoteSession : public std::enable_shared_from_this<RemoteSession> {
  public:
    using StartHandler = std::function<void(const error_code &ec)>;

    RemoteSession(net::io_context &ioc, ChannelFactory factory, std::string address,
                  const ClientConfig &config, std::optional<PeerTrust> trust,
                  RemoteCallbacks callbacks);
    ~RemoteSession();

    RemoteSession(const RemoteSession &) = delete;
    RemoteSession &operator=(const RemoteSession &) = delete;

    // Connects and runs the configuration exchange. handler fires once with
    // success when the session reaches Connected, or with the first failure:
    // connect_failed, timed_out, trust_changed, handshake_failed, cancelled.
    void start(StartHandler handler);

    // Blocking start for callers outside the I/O thread. Throws the typed error.
    void startAndWait();

    // Closes the connection and stops reconnecting. Idempotent.
    void stop();

    // Queue a command. Throw NotConnectedError unless Connected.
    void sendKey(int32_t keyCode, Messages::KeyDirection direction = Messages::KeyDirection::SHORT);
    void sendText(const std::string &text);
    void launchAppLink(const std::string &appLink);

    ConnectionState state() const { return state_.load(); }
    RemoteStatus status() const { return protocol_.status(); }
    const RemoteProtocol &protocol() const { return protocol_; }
    const std::string &address() const { return address_; }
    std::chrono::milliseconds reconnectDelay() const {
        return std::chrono::milliseconds(reconnectDelayMs_.load());
    }
    std::chrono::steady_clock::time_point lastSeenAlive() const;

  private:
    void attemptConnect();
    void handleConnected(const error_code &ec, std::shared_ptr<Transport::MessageChannel> channel);
    void handleFrame(const std::shared_ptr<Transport::MessageChannel> &channel,
                     std::vector<uint8_t> payload);
    void handleClosed(const std::shared_ptr<Transport::MessageChannel> &channel,
                      const error_code &ec);
    void handleKeepAliveTimeout();
    void armHandshakeTimer();
    bool checkPeerTrust();
    void enqueue(Messages::RemoteMessage message);

    // Ends the current connection. terminal stops any reconnect.
    void connectionLost(const error_code &ec, bool terminal);
    void scheduleReconnect();
    void finishStart(const error_code &ec);
    void setState(ConnectionState state);
    void cancelTimers();

    net::strand<net::io_context::executor_type> strand_;
    ChannelFactory factory_;
    std::string address_;
    TimeoutConfig timeouts_;
    ReconnectConfig reconnect_;
    bool strictPinning_;
    std::optional<PeerTrust> trust_;
    RemoteCallbacks callbacks_;

    RemoteProtocol protocol_;
    std::shared_ptr<KeepAliveManager> keepAlive_;
    std::shared_ptr<Transport::MessageChannel> channel_;
    net::steady_timer handshakeTimer_;
    net::steady_timer reconnectTimer_;
    uint64_t timerGeneration_ = 0;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<int64_t> reconnectDelayMs_;
    bool started_ = false;
    bool stopped_ = false;
    bool everConnected_ = false;
    StartHandler startHandler_;
};

} // namespace Remote
} // namespace AndroidTV

#endif // ATV_REMOTE_SESSION_HPP

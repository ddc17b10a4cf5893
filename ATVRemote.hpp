#ifndef ATV_REMOTE_HPP
#define ATV_REMOTE_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ATVConfig.hpp"
#include "identityStore.hpp"
#include "pairingSession.hpp"
#include "remoteSession.hpp"
#include "tlsConnection.hpp"

namespace AndroidTV {

// Entry point of the library. Owns the I/O thread and the client identity;
// pairs with devices and opens remote control sessions to them.
class ATVRemote {
  public:
    // Blocking code source for pair(). Return std::nullopt to give up.
    using CodeProvider = std::function<std::optional<std::string>(const PairingEncoding &encoding)>;
    using AsyncCodeHandler = std::function<void(
        const PairingEncoding &encoding, std::shared_ptr<Pairing::PairingSession> session)>;

    explicit ATVRemote(ClientConfig config = {});
    ~ATVRemote();

    ATVRemote(const ATVRemote &) = delete;
    ATVRemote &operator=(const ATVRemote &) = delete;

    // Runs the pairing handshake on the pairing port and records the device
    // as trusted. Throws the typed error on failure (CodeMismatchError,
    // NegotiationError, TimeoutError, ConnectError, CancelledError...).
    // Must not be called from a handler running on this client's I/O thread.
    PeerTrust pair(const std::string &address, CodeProvider codeProvider);

    // Asynchronous pair(). onCodeNeeded answers through session->submitCode()
    // or session->cancel(). Closing the returned connection aborts.
    std::shared_ptr<Transport::TlsConnection>
    asyncPair(const std::string &address, AsyncCodeHandler onCodeNeeded,
              Pairing::PairingSession::CompletionHandler onComplete);

    // Opens a remote control session and waits for the configuration
    // exchange. Throws ConnectError, TrustChangedError, HandshakeError or
    // TimeoutError.
    std::shared_ptr<Remote::RemoteSession> connect(const std::string &address,
                                                   Remote::RemoteCallbacks callbacks = {});

    // Device name and MAC address from the control port certificate.
    std::pair<std::string, std::string> getNameAndMac(const std::string &address);

    // "atvremote/<x>/<y>/<name>/<mac>" -> {name, mac}. Throws ProtocolError.
    static std::pair<std::string, std::string> parseNameAndMac(std::string_view commonName);

    // "POWER" or "KEYCODE_POWER" -> 26. Throws std::invalid_argument.
    static int32_t keyCodeFromName(std::string_view name);

    const ClientConfig &config() const { return config_; }
    IdentityStore &identityStore() { return identityStore_; }
    boost::asio::io_context &ioContext() { return ioc_; }

  private:
    void shutdown();

    ClientConfig config_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread worker_;
    IdentityStore identityStore_;

    std::mutex sessionsMutex_;
    std::vector<std::weak_ptr<Remote::RemoteSession>> sessions_;
};

} // namespace AndroidTV

#endif // ATV_REMOTE_HPP

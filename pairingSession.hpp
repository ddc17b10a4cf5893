#ifndef ATV_PAIRING_SESSION_HPP
#define ATV_PAIRING_SESSION_HPP

#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ATVConfig.hpp"
#include "ATVErrors.hpp"
#include "ATVUtils.hpp"
#include "identityStore.hpp"
#include "messages.hpp"
#include "tlsConnection.hpp"

namespace AndroidTV {
namespace Pairing {

enum class PairingState {
  Idle,
  RequestSent,
  OptionNegotiated,
  ConfigurationSent,
  AwaitingCode,
  SecretSent,
  Paired,
  Failed
};

std::string_view toString(PairingState state);

// SHA-256(client_modulus ++ client_exponent ++ server_modulus ++
// server_exponent ++ nonce), RSA components in minimal big-endian form.
std::vector<uint8_t> computeSecret(const Utils::RsaPublicComponents &client,
                                   const Utils::RsaPublicComponents &server,
                                   const std::vector<uint8_t> &nonce);

// Device-side derivation of the code shown on screen: hex of the checksum
// byte secret[0] followed by hex of the nonce.
std::string pairingCodeFor(const X509 *clientCert, const X509 *serverCert,
                           const std::vector<uint8_t> &nonce);

// Message sequencing of one handshake, without I/O. Every call either returns
// what to send next or throws; a throw leaves the machine in Failed.
class PairingStateMachine {
  public:
    struct Step {
        std::optional<Messages::OuterMessage> reply;
        bool codeNeeded = false;
        bool paired = false;
    };

    // Throws ConfigError unless every encoding is hexadecimal with an even
    // symbol length of at least 4.
    PairingStateMachine(std::string serviceName, std::string clientName,
                        std::vector<PairingEncoding> encodings);

    // Idle -> RequestSent
    Messages::OuterMessage start();

    // Advances on a message from the device.
    Step onMessage(const Messages::OuterMessage &message);

    // AwaitingCode -> SecretSent. Throws CodeMismatchError when the code has
    // the wrong length or alphabet or its checksum does not match.
    Messages::OuterMessage submitCode(std::string_view code, const X509 *clientCert,
                                      const X509 *serverCert);

    void fail();

    PairingState state() const { return state_; }
    const std::optional<PairingEncoding> &negotiatedEncoding() const { return encoding_; }
    const std::vector<uint8_t> &secret() const { return secret_; }
    const std::string &serverName() const { return serverName_; }

  private:
    void expect(Messages::PairingMessageKind expected, Messages::PairingMessageKind actual);
    PairingEncoding negotiate(const polo::wire::protobuf::Options &peerOptions) const;
    template <typename E> [[noreturn]] void failWith(const E &error) {
        state_ = PairingState::Failed;
        throw error;
    }

    std::string serviceName_;
    std::string clientName_;
    std::vector<PairingEncoding> encodings_;

    PairingState state_ = PairingState::Idle;
    bool optionsSent_ = false;
    std::optional<PairingEncoding> encoding_;
    std::vector<uint8_t> secret_;
    std::string serverName_;
};

// Drives a PairingStateMachine over a channel to the pairing port. All work
// runs on the channel's executor; public methods may be called from any thread.
class PairingSession : public std::enable_shared_from_this<PairingSession> {
  public:
    // Invoked once, in AwaitingCode. Answer with submitCode() or cancel().
    using CodeRequestHandler = std::function<void(const PairingEncoding &encoding)>;
    using CompletionHandler =
        std::function<void(const error_code &ec, std::optional<PeerTrust> trust)>;
    using StateHandler = std::function<void(PairingState state)>;

    PairingSession(std::shared_ptr<Transport::MessageChannel> channel, std::string address,
                   const ClientConfig &config);
    ~PairingSession();

    PairingSession(const PairingSession &) = delete;
    PairingSession &operator=(const PairingSession &) = delete;

    void setStateHandler(StateHandler handler) { stateHandler_ = std::move(handler); }

    // Single shot.
    void start(CodeRequestHandler onCodeNeeded, CompletionHandler onComplete);
    void submitCode(std::string code);
    void cancel();

    PairingState state() const { return publishedState_.load(); }

  private:
    void handleFrame(std::vector<uint8_t> payload);
    void handleClosed(const error_code &ec);
    void handleSubmitCode(const std::string &code);
    void send(const Messages::OuterMessage &message);
    void armStepTimer();
    void publishState();
    void succeed();
    void fail(const error_code &ec, const std::string &reason);

    std::shared_ptr<Transport::MessageChannel> channel_;
    std::string address_;
    std::chrono::milliseconds stepTimeout_;
    boost::asio::steady_timer stepTimer_;
    uint64_t timerGeneration_ = 0;

    PairingStateMachine machine_;
    std::atomic<PairingState> publishedState_{PairingState::Idle};
    bool started_ = false;
    bool finished_ = false;

    CodeRequestHandler onCodeNeeded_;
    CompletionHandler onComplete_;
    StateHandler stateHandler_;
};

} // namespace Pairing
} // namespace AndroidTV

#endif // ATV_PAIRING_SESSION_HPP

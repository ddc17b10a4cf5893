#include "pairingSession.hpp"
#include "frameCodec.hpp"
#include "logger.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>

namespace AndroidTV {
namespace Pairing {

using Messages::OuterMessage;
using Messages::PairingMessageKind;

std::string_view toString(PairingState state) {
    switch (state) {
        case PairingState::Idle: return "Idle";
        case PairingState::RequestSent: return "RequestSent";
        case PairingState::OptionNegotiated: return "OptionNegotiated";
        case PairingState::ConfigurationSent: return "ConfigurationSent";
        case PairingState::AwaitingCode: return "AwaitingCode";
        case PairingState::SecretSent: return "SecretSent";
        case PairingState::Paired: return "Paired";
        case PairingState::Failed: return "Failed";
    }
    return "Unknown";
}

std::vector<uint8_t> computeSecret(const Utils::RsaPublicComponents &client,
                                   const Utils::RsaPublicComponents &server,
                                   const std::vector<uint8_t> &nonce) {
    std::vector<uint8_t> input;
    input.reserve(client.modulus.size() + client.exponent.size() + server.modulus.size() +
                  server.exponent.size() + nonce.size());
    input.insert(input.end(), client.modulus.begin(), client.modulus.end());
    input.insert(input.end(), client.exponent.begin(), client.exponent.end());
    input.insert(input.end(), server.modulus.begin(), server.modulus.end());
    input.insert(input.end(), server.exponent.begin(), server.exponent.end());
    input.insert(input.end(), nonce.begin(), nonce.end());
    return Utils::sha256(input);
}

std::string pairingCodeFor(const X509 *clientCert, const X509 *serverCert,
                           const std::vector<uint8_t> &nonce) {
    auto secret = computeSecret(Utils::rsaPublicComponents(clientCert),
                                Utils::rsaPublicComponents(serverCert), nonce);
    return Utils::toHex(secret.data(), 1) + Utils::toHex(nonce);
}

// --- PairingStateMachine ---

PairingStateMachine::PairingStateMachine(std::string serviceName, std::string clientName,
                                         std::vector<PairingEncoding> encodings)
    : serviceName_(std::move(serviceName)), clientName_(std::move(clientName)),
      encodings_(std::move(encodings)) {
    if (encodings_.empty()) {
        throw ConfigError("no pairing encodings configured");
    }
    for (const auto &encoding : encodings_) {
        if (encoding.type != PairingEncoding::Type::HEXADECIMAL ||
            encoding.symbolLength < 4 || encoding.symbolLength % 2 != 0) {
            throw ConfigError(fmt::format("unsupported pairing encoding {}/{}",
                                          toString(encoding.type), encoding.symbolLength));
        }
    }
}

void PairingStateMachine::fail() {
    if (state_ != PairingState::Paired) {
        state_ = PairingState::Failed;
    }
}

OuterMessage PairingStateMachine::start() {
    if (state_ != PairingState::Idle) {
        failWith(ProtocolError("pairing already started"));
    }
    state_ = PairingState::RequestSent;
    return Messages::makePairingRequest(serviceName_, clientName_);
}

void PairingStateMachine::expect(PairingMessageKind expected, PairingMessageKind actual) {
    if (expected != actual) {
        failWith(ProtocolError(fmt::format("expected {} in state {}, got {}",
                                           Messages::toString(expected),
                                           toString(state_), Messages::toString(actual))));
    }
}

PairingEncoding
PairingStateMachine::negotiate(const polo::wire::protobuf::Options &peerOptions) const {
    std::vector<PairingEncoding> offered;
    for (const auto &e : peerOptions.input_encodings()) {
        if (auto encoding = Messages::fromWire(e)) offered.push_back(*encoding);
    }
    for (const auto &e : peerOptions.output_encodings()) {
        if (auto encoding = Messages::fromWire(e)) offered.push_back(*encoding);
    }
    if (peerOptions.input_encodings_size() == 0 && peerOptions.output_encodings_size() == 0) {
        return encodings_.front();
    }
    for (const auto &local : encodings_) {
        if (std::find(offered.begin(), offered.end(), local) != offered.end()) {
            return local;
        }
    }
    throw NegotiationError("device offers no supported pairing encoding");
}

PairingStateMachine::Step PairingStateMachine::onMessage(const OuterMessage &message) {
    if (state_ == PairingState::Paired || state_ == PairingState::Failed ||
        state_ == PairingState::Idle) {
        failWith(ProtocolError(fmt::format("message received in state {}", toString(state_))));
    }

    if (message.status() != OuterMessage::STATUS_OK) {
        switch (message.status()) {
            case OuterMessage::STATUS_BAD_SECRET:
                failWith(CodeMismatchError("device rejected the pairing code"));
            case OuterMessage::STATUS_BAD_CONFIGURATION:
                failWith(NegotiationError("device rejected the pairing configuration"));
            default:
                failWith(PairingError(fmt::format("device reported status {}",
                                                  static_cast<int>(message.status()))));
        }
    }

    const auto kind = Messages::kindOf(message);
    Step step;
    switch (state_) {
        case PairingState::RequestSent:
            if (!optionsSent_) {
                expect(PairingMessageKind::PairingRequestAck, kind);
                serverName_ = message.pairing_request_ack().server_name();
                optionsSent_ = true;
                step.reply = Messages::makeOptions(encodings_);
            } else {
                expect(PairingMessageKind::Options, kind);
                try {
                    encoding_ = negotiate(message.options());
                } catch (const NegotiationError &) {
                    state_ = PairingState::Failed;
                    throw;
                }
                state_ = PairingState::OptionNegotiated;
                step.reply = Messages::makeConfiguration(*encoding_);
                state_ = PairingState::ConfigurationSent;
            }
            break;
        case PairingState::ConfigurationSent:
            expect(PairingMessageKind::ConfigurationAck, kind);
            state_ = PairingState::AwaitingCode;
            step.codeNeeded = true;
            break;
        case PairingState::SecretSent:
            expect(PairingMessageKind::SecretAck, kind);
            state_ = PairingState::Paired;
            step.paired = true;
            break;
        default:
            failWith(ProtocolError(fmt::format("unexpected {} in state {}",
                                               Messages::toString(kind), toString(state_))));
    }
    return step;
}

OuterMessage PairingStateMachine::submitCode(std::string_view code, const X509 *clientCert,
                                             const X509 *serverCert) {
    if (state_ != PairingState::AwaitingCode || !encoding_) {
        failWith(ProtocolError(fmt::format("code submitted in state {}", toString(state_))));
    }
    if (code.size() != encoding_->symbolLength) {
        failWith(CodeMismatchError(fmt::format("expected a {} symbol code, got {}",
                                               encoding_->symbolLength, code.size())));
    }
    auto checksum = Utils::fromHex(code.substr(0, 2));
    auto nonce = Utils::fromHex(code.substr(2));
    if (!checksum || !nonce) {
        failWith(CodeMismatchError("pairing code is not hexadecimal"));
    }
    if (clientCert == nullptr || serverCert == nullptr) {
        failWith(IdentityError("certificates unavailable for the pairing secret"));
    }

    std::vector<uint8_t> secret;
    try {
        secret = computeSecret(Utils::rsaPublicComponents(clientCert),
                               Utils::rsaPublicComponents(serverCert), *nonce);
    } catch (const Error &) {
        state_ = PairingState::Failed;
        throw;
    }
    if (secret.front() != checksum->front()) {
        failWith(CodeMismatchError("pairing code checksum does not match"));
    }
    secret_ = std::move(secret);
    state_ = PairingState::SecretSent;
    return Messages::makeSecret(secret_);
}

// --- PairingSession ---

PairingSession::PairingSession(std::shared_ptr<Transport::MessageChannel> channel,
                               std::string address, const ClientConfig &config)
    : channel_(std::move(channel)), address_(std::move(address)),
      stepTimeout_(config.timeouts.pairingStep), stepTimer_(channel_->executor()),
      machine_(config.serviceName, config.clientName, config.pairing.encodings) {}

PairingSession::~PairingSession() {
    LOG_VERBOSE("PairingSession for {} destroyed in state {}", address_,
                toString(machine_.state()));
}

void PairingSession::start(CodeRequestHandler onCodeNeeded, CompletionHandler onComplete) {
    boost::asio::post(channel_->executor(), [self = shared_from_this(),
                                             onCodeNeeded = std::move(onCodeNeeded),
                                             onComplete = std::move(onComplete)]() mutable {
        if (self->started_) {
            LOG_WARN("Pairing with {} already started", self->address_);
            onComplete(make_error_code(errc::protocol_violation), std::nullopt);
            return;
        }
        self->started_ = true;
        self->onCodeNeeded_ = std::move(onCodeNeeded);
        self->onComplete_ = std::move(onComplete);

        std::weak_ptr<PairingSession> weak = self;
        self->channel_->startReading(
            [weak](std::vector<uint8_t> payload) {
                if (auto s = weak.lock()) s->handleFrame(std::move(payload));
            },
            [weak](const error_code &ec) {
                if (auto s = weak.lock()) s->handleClosed(ec);
            });

        LOG_INFO("Pairing with {}", self->address_);
        try {
            self->send(self->machine_.start());
        } catch (const Error &e) {
            self->fail(e.code(), e.what());
            return;
        }
        self->publishState();
        self->armStepTimer();
    });
}

void PairingSession::submitCode(std::string code) {
    boost::asio::post(channel_->executor(),
                      [self = shared_from_this(), code = std::move(code)]() {
                          self->handleSubmitCode(code);
                      });
}

void PairingSession::cancel() {
    boost::asio::post(channel_->executor(), [self = shared_from_this()]() {
        if (!self->finished_) {
            LOG_INFO("Pairing with {} cancelled", self->address_);
            self->fail(make_error_code(errc::cancelled), "cancelled by caller");
        }
    });
}

void PairingSession::send(const OuterMessage &message) {
    LOG_DEBUG("Sending: {}", message);
    channel_->sendMessage(message);
}

void PairingSession::armStepTimer() {
    ++timerGeneration_;
    stepTimer_.expires_after(stepTimeout_);
    stepTimer_.async_wait([weak = std::weak_ptr<PairingSession>(shared_from_this()),
                           generation = timerGeneration_](const error_code &ec) {
        auto self = weak.lock();
        if (!self || ec == boost::asio::error::operation_aborted ||
            generation != self->timerGeneration_ || self->finished_) {
            return;
        }
        LOG_ERROR("No reply from {} within {} ms in state {}", self->address_,
                  self->stepTimeout_.count(), toString(self->machine_.state()));
        self->fail(make_error_code(errc::timed_out), "pairing step timed out");
    });
}

void PairingSession::publishState() {
    auto state = machine_.state();
    if (publishedState_.exchange(state) == state) {
        return;
    }
    LOG_DEBUG("Pairing state -> {}", toString(state));
    if (stateHandler_) {
        stateHandler_(state);
    }
}

void PairingSession::handleFrame(std::vector<uint8_t> payload) {
    if (finished_) {
        return;
    }
    PairingStateMachine::Step step;
    try {
        auto message = Codec::decodeMessage<OuterMessage>(payload);
        LOG_DEBUG("Received: {}", message);
        auto before = machine_.state();
        step = machine_.onMessage(message);
        // Options reply passes through OptionNegotiated on its way to ConfigurationSent
        if (before == PairingState::RequestSent &&
            machine_.state() == PairingState::ConfigurationSent) {
            publishedState_.store(PairingState::OptionNegotiated);
            if (stateHandler_) stateHandler_(PairingState::OptionNegotiated);
        }
        if (step.reply) {
            send(*step.reply);
        }
    } catch (const Error &e) {
        if (e.code() == errc::framing_error) {
            LOG_DEBUG("Undecodable frame from {}:\n{:xL64}", address_, payload);
        }
        fail(e.code(), e.what());
        return;
    }
    publishState();

    if (step.paired) {
        succeed();
    } else if (step.codeNeeded) {
        ++timerGeneration_;
        stepTimer_.cancel();
        LOG_INFO("Waiting for the pairing code shown on {}", address_);
        if (onCodeNeeded_) {
            onCodeNeeded_(*machine_.negotiatedEncoding());
        }
    } else {
        armStepTimer();
    }
}

void PairingSession::handleSubmitCode(const std::string &code) {
    if (finished_) {
        LOG_WARN("Code submitted after pairing finished");
        return;
    }
    try {
        send(machine_.submitCode(code, channel_->localCertificate(),
                                 channel_->peerCertificate()));
    } catch (const Error &e) {
        fail(e.code(), e.what());
        return;
    }
    publishState();
    armStepTimer();
}

void PairingSession::handleClosed(const error_code &ec) {
    if (finished_) {
        return;
    }
    if (ec.category() == atv_category()) {
        fail(ec, "connection failed");
    } else {
        fail(make_error_code(errc::pairing_failed),
             fmt::format("connection closed by device: {}", ec.message()));
    }
}

void PairingSession::succeed() {
    finished_ = true;
    ++timerGeneration_;
    stepTimer_.cancel();

    PeerTrust trust;
    trust.address = address_;
    trust.serverName = machine_.serverName();
    trust.pairedAt = std::chrono::system_clock::now();
    try {
        trust.fingerprint = fingerprintOf(channel_->peerCertificate());
    } catch (const Error &e) {
        LOG_ERROR("Cannot fingerprint {}: {}", address_, e.what());
        channel_->close();
        if (onComplete_) onComplete_(e.code(), std::nullopt);
        return;
    }
    LOG_INFO("Paired with {} ({})", address_, trust.fingerprint);
    channel_->close();
    auto onComplete = std::move(onComplete_);
    onComplete_ = nullptr;
    if (onComplete) {
        onComplete({}, std::move(trust));
    }
}

void PairingSession::fail(const error_code &ec, const std::string &reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    ++timerGeneration_;
    stepTimer_.cancel();
    machine_.fail();
    publishState();
    LOG_ERROR("Pairing with {} failed: {} ({})", address_, reason, ec.message());
    channel_->close();
    auto onComplete = std::move(onComplete_);
    onComplete_ = nullptr;
    if (onComplete) {
        onComplete(ec, std::nullopt);
    }
}

} // namespace Pairing
} // namespace AndroidTV

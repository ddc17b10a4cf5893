#include "remoteSession.hpp"
#include "frameCodec.hpp"
#include "logger.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <future>

namespace AndroidTV {
namespace Remote {

using Messages::RemoteMessage;
using Transport::MessageChannel;

std::chrono::milliseconds nextReconnectDelay(std::chrono::milliseconds delay,
                                             const ReconnectConfig &config) {
    return std::min(delay * 2, config.maxDelay);
}

RemoteSession::RemoteSession(net::io_context &ioc, ChannelFactory factory, std::string address,
                             const ClientConfig &config, std::optional<PeerTrust> trust,
                             RemoteCallbacks callbacks)
    : strand_(net::make_strand(ioc)), factory_(std::move(factory)),
      address_(std::move(address)), timeouts_(config.timeouts), reconnect_(config.reconnect),
      strictPinning_(config.strictPinning), trust_(std::move(trust)),
      callbacks_(std::move(callbacks)), protocol_(config.device), handshakeTimer_(strand_),
      reconnectTimer_(strand_), reconnectDelayMs_(config.reconnect.initialDelay.count()) {}

RemoteSession::~RemoteSession() {
    if (channel_) {
        channel_->close();
    }
    LOG_VERBOSE("RemoteSession for {} destroyed", address_);
}

std::chrono::steady_clock::time_point RemoteSession::lastSeenAlive() const {
    return keepAlive_ ? keepAlive_->last_seen_alive() : std::chrono::steady_clock::time_point{};
}

void RemoteSession::start(StartHandler handler) {
    if (!keepAlive_) {
        std::weak_ptr<RemoteSession> weak = shared_from_this();
        keepAlive_ = std::make_shared<KeepAliveManager>(strand_, timeouts_.keepAlive, [weak]() {
            if (auto self = weak.lock()) self->handleKeepAliveTimeout();
        });
    }
    net::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        if (self->started_) {
            LOG_WARN("Session with {} already started", self->address_);
            handler(make_error_code(errc::protocol_violation));
            return;
        }
        if (self->stopped_) {
            handler(make_error_code(errc::cancelled));
            return;
        }
        self->started_ = true;
        self->startHandler_ = std::move(handler);
        self->attemptConnect();
    });
}

void RemoteSession::startAndWait() {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    start([promise, address = address_](const error_code &ec) {
        if (ec) {
            promise->set_exception(
                makeExceptionPtr(ec, fmt::format("{}: {}", address, ec.message())));
        } else {
            promise->set_value();
        }
    });
    future.get();
}

void RemoteSession::stop() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->stopped_) {
            return;
        }
        self->stopped_ = true;
        LOG_INFO("Stopping session with {}", self->address_);
        self->cancelTimers();
        if (self->keepAlive_) {
            self->keepAlive_->stop();
        }
        if (auto channel = std::move(self->channel_)) {
            channel->close();
        }
        self->setState(ConnectionState::Disconnected);
        self->finishStart(make_error_code(errc::cancelled));
    });
}

void RemoteSession::attemptConnect() {
    if (stopped_) {
        return;
    }
    setState(ConnectionState::Connecting);
    LOG_INFO("Connecting to {}", address_);

    std::weak_ptr<RemoteSession> weak = shared_from_this();
    try {
        channel_ = factory_([weak, strand = strand_](const error_code &ec,
                                                     std::shared_ptr<MessageChannel> channel) {
            net::post(strand, [weak, ec, channel = std::move(channel)]() mutable {
                if (auto self = weak.lock()) {
                    self->handleConnected(ec, std::move(channel));
                }
            });
        });
    } catch (const Error &e) {
        LOG_ERROR("Cannot open a connection to {}: {}", address_, e.what());
        connectionLost(e.code(), true);
    }
}

void RemoteSession::handleConnected(const error_code &ec,
                                    std::shared_ptr<MessageChannel> channel) {
    if (stopped_) {
        if (channel) channel->close();
        return;
    }
    if (ec) {
        LOG_WARN("Connection to {} failed: {}", address_, ec.message());
        channel_.reset();
        if (ec == errc::tls_failed) {
            // The device refuses the client certificate: pairing is gone.
            connectionLost(make_error_code(errc::trust_changed), true);
        } else {
            connectionLost(ec, false);
        }
        return;
    }

    channel_ = std::move(channel);
    setState(ConnectionState::ConfiguringSession);
    protocol_.beginHandshake();
    if (!checkPeerTrust()) {
        return;
    }

    std::weak_ptr<RemoteSession> weak = shared_from_this();
    std::weak_ptr<MessageChannel> weakChannel = channel_;
    channel_->startReading(
        [weak, weakChannel, strand = strand_](std::vector<uint8_t> payload) {
            net::post(strand, [weak, weakChannel, payload = std::move(payload)]() mutable {
                auto self = weak.lock();
                auto channel = weakChannel.lock();
                if (self && channel) self->handleFrame(channel, std::move(payload));
            });
        },
        [weak, weakChannel, strand = strand_](const error_code &ec) {
            net::post(strand, [weak, weakChannel, ec]() {
                auto self = weak.lock();
                auto channel = weakChannel.lock();
                if (self && channel) self->handleClosed(channel, ec);
            });
        });
    armHandshakeTimer();
}

bool RemoteSession::checkPeerTrust() {
    if (!trust_) {
        return true;
    }
    std::string actual;
    try {
        actual = fingerprintOf(channel_->peerCertificate());
    } catch (const Error &e) {
        LOG_ERROR("Cannot fingerprint {}: {}", address_, e.what());
        connectionLost(make_error_code(errc::trust_changed), true);
        return false;
    }
    if (actual == trust_->fingerprint) {
        return true;
    }
    LOG_WARN("Certificate of {} changed since pairing: expected {}, got {}", address_,
             trust_->fingerprint, actual);
    if (callbacks_.onFingerprintChanged) {
        callbacks_.onFingerprintChanged(trust_->fingerprint, actual);
    }
    if (strictPinning_) {
        connectionLost(make_error_code(errc::trust_changed), true);
        return false;
    }
    return true;
}

void RemoteSession::handleFrame(const std::shared_ptr<MessageChannel> &channel,
                                std::vector<uint8_t> payload) {
    if (stopped_ || channel != channel_) {
        return;
    }
    keepAlive_->traffic_received();

    RemoteProtocol::Step step;
    try {
        auto message = Codec::decodeMessage<RemoteMessage>(payload);
        bool ping = Messages::kindOf(message) == Messages::RemoteMessageKind::PingRequest;
        if (ping) {
            LOG_VERBOSE("Received: {}", message);
        } else {
            LOG_DEBUG("Received: {}", message);
        }
        step = protocol_.onMessage(message);
        for (const auto &reply : step.replies) {
            if (step.keepAlive) {
                LOG_VERBOSE("Sending: {}", reply);
            } else {
                LOG_DEBUG("Sending: {}", reply);
            }
            channel_->sendMessage(reply);
        }
    } catch (const Error &e) {
        if (e.code() == errc::framing_error) {
            LOG_DEBUG("Undecodable frame from {}:\n{:xL64}", address_, payload);
        }
        LOG_ERROR("Session with {} failed: {}", address_, e.what());
        connectionLost(e.code(), e.code() == errc::handshake_failed);
        return;
    }

    if (step.started) {
        ++timerGeneration_;
        handshakeTimer_.cancel();
        everConnected_ = true;
        reconnectDelayMs_.store(reconnect_.initialDelay.count());
        setState(ConnectionState::Connected);
        keepAlive_->start();
        LOG_INFO("Remote session with {} started", address_);
        finishStart({});
    }

    if (!step.updates.empty() && callbacks_.onStatusUpdate) {
        auto status = protocol_.status();
        for (auto field : step.updates) {
            callbacks_.onStatusUpdate(field, status);
        }
    }
}

void RemoteSession::handleClosed(const std::shared_ptr<MessageChannel> &channel,
                                 const error_code &ec) {
    if (stopped_ || channel != channel_) {
        return;
    }
    if (state_.load() == ConnectionState::Connected) {
        LOG_WARN("Connection to {} lost: {}", address_, ec.message());
        connectionLost(ec, false);
        return;
    }
    LOG_WARN("Connection to {} closed during configuration: {}", address_, ec.message());
    if (ec == errc::tls_failed) {
        connectionLost(make_error_code(errc::trust_changed), true);
    } else {
        connectionLost(make_error_code(errc::handshake_failed), true);
    }
}

void RemoteSession::handleKeepAliveTimeout() {
    if (stopped_ || state_.load() != ConnectionState::Connected) {
        return;
    }
    LOG_WARN("No traffic from {} within {} ms", address_, timeouts_.keepAlive.count());
    connectionLost(make_error_code(errc::timed_out), false);
}

void RemoteSession::armHandshakeTimer() {
    auto generation = ++timerGeneration_;
    handshakeTimer_.expires_after(timeouts_.sessionHandshake);
    handshakeTimer_.async_wait([weak = std::weak_ptr<RemoteSession>(shared_from_this()),
                                generation](const error_code &ec) {
        auto self = weak.lock();
        if (!self || ec == net::error::operation_aborted ||
            generation != self->timerGeneration_ ||
            self->state_.load() != ConnectionState::ConfiguringSession) {
            return;
        }
        LOG_ERROR("Configuration exchange with {} timed out after {} ms", self->address_,
                  self->timeouts_.sessionHandshake.count());
        self->connectionLost(make_error_code(errc::timed_out), false);
    });
}

void RemoteSession::connectionLost(const error_code &ec, bool terminal) {
    bool wasConnected = state_.load() == ConnectionState::Connected;
    cancelTimers();
    keepAlive_->stop();
    if (auto channel = std::move(channel_)) {
        channel->close();
    }
    setState(ConnectionState::Disconnected);

    if (ec == errc::trust_changed) {
        LOG_ERROR("{} no longer accepts this client, pair again", address_);
        if (callbacks_.onInvalidAuth) {
            callbacks_.onInvalidAuth();
        }
    }
    if (!everConnected_) {
        finishStart(ec);
        return;
    }
    // A terminal failure while reconnecting is reported too: nothing follows it.
    if ((wasConnected || terminal) && callbacks_.onDisconnect) {
        callbacks_.onDisconnect(ec);
    }
    if (terminal || !reconnect_.enabled || stopped_) {
        return;
    }
    scheduleReconnect();
}

void RemoteSession::scheduleReconnect() {
    auto delay = std::chrono::milliseconds(reconnectDelayMs_.load());
    reconnectDelayMs_.store(nextReconnectDelay(delay, reconnect_).count());
    LOG_INFO("Reconnecting to {} in {} ms", address_, delay.count());

    auto generation = ++timerGeneration_;
    reconnectTimer_.expires_after(delay);
    reconnectTimer_.async_wait([weak = std::weak_ptr<RemoteSession>(shared_from_this()),
                                generation](const error_code &ec) {
        auto self = weak.lock();
        if (!self || ec == net::error::operation_aborted ||
            generation != self->timerGeneration_) {
            return;
        }
        self->attemptConnect();
    });
}

void RemoteSession::finishStart(const error_code &ec) {
    auto handler = std::move(startHandler_);
    startHandler_ = nullptr;
    if (handler) {
        handler(ec);
    }
}

void RemoteSession::setState(ConnectionState state) {
    if (state_.exchange(state) == state) {
        return;
    }
    LOG_DEBUG("Session {} -> {}", address_, toString(state));
    if (callbacks_.onStateChanged) {
        callbacks_.onStateChanged(state);
    }
}

void RemoteSession::cancelTimers() {
    ++timerGeneration_;
    handshakeTimer_.cancel();
    reconnectTimer_.cancel();
}

void RemoteSession::enqueue(RemoteMessage message) {
    net::post(strand_, [self = shared_from_this(), message = std::move(message)]() {
        if (self->state_.load() != ConnectionState::Connected || !self->channel_) {
            LOG_WARN("Dropping command for {}: connection lost", self->address_);
            return;
        }
        LOG_DEBUG("Sending: {}", message);
        try {
            self->channel_->sendMessage(message);
        } catch (const Error &e) {
            LOG_ERROR("Cannot send to {}: {}", self->address_, e.what());
        }
    });
}

void RemoteSession::sendKey(int32_t keyCode, Messages::KeyDirection direction) {
    if (state_.load() != ConnectionState::Connected) {
        throw NotConnectedError(fmt::format("{} is {}", address_, toString(state_.load())));
    }
    enqueue(protocol_.keyCommand(Messages::KeyCommand{keyCode, direction}));
}

void RemoteSession::sendText(const std::string &text) {
    if (state_.load() != ConnectionState::Connected) {
        throw NotConnectedError(fmt::format("{} is {}", address_, toString(state_.load())));
    }
    enqueue(protocol_.textCommand(text));
}

void RemoteSession::launchAppLink(const std::string &appLink) {
    if (state_.load() != ConnectionState::Connected) {
        throw NotConnectedError(fmt::format("{} is {}", address_, toString(state_.load())));
    }
    enqueue(protocol_.appLinkCommand(appLink));
}

} // namespace Remote
} // namespace AndroidTV

#include "tlsConnection.hpp"
#include "ATVErrors.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <future>

namespace AndroidTV {
namespace Transport {

net::ssl::context makeClientContext(const Identity &identity) {
  net::ssl::context ctx(net::ssl::context::tls_client);
  // Trust comes from pairing, not from a CA chain.
  ctx.set_verify_mode(net::ssl::verify_none);

  error_code ec;
  ctx.use_certificate(net::buffer(identity.certificatePem), net::ssl::context::pem, ec);
  if (!ec) {
    ctx.use_private_key(net::buffer(identity.privateKeyPem), net::ssl::context::pem, ec);
  }
  if (ec) {
    LOG_ERROR("Client identity rejected by TLS context: {}", ec.message());
    throw IdentityError("client identity rejected by TLS context: " + ec.message());
  }
  return ctx;
}

TlsConnection::TlsConnection(net::io_context &ioc, std::shared_ptr<const Identity> identity,
                             size_t maxFrameSize)
    : strand_(net::make_strand(ioc)), identity_(std::move(identity)),
      sslContext_(makeClientContext(*identity_)), stream_(strand_, sslContext_),
      resolver_(strand_), timer_(strand_), decoder_(maxFrameSize) {}

TlsConnection::~TlsConnection() {
  LOG_VERBOSE("TlsConnection to {} destroyed", host_);
  error_code ignored_ec;
  stream_.lowest_layer().close(ignored_ec);
}

std::shared_ptr<TlsConnection>
TlsConnection::asyncConnect(net::io_context &ioc, const std::string &host, uint16_t port,
                            std::shared_ptr<const Identity> identity,
                            const TimeoutConfig &timeouts, size_t maxFrameSize,
                            ConnectHandler handler) {
  auto connection = std::make_shared<TlsConnection>(ioc, std::move(identity), maxFrameSize);
  connection->start(host, port, timeouts, std::move(handler));
  return connection;
}

std::shared_ptr<TlsConnection>
TlsConnection::connect(net::io_context &ioc, const std::string &host, uint16_t port,
                       std::shared_ptr<const Identity> identity,
                       const TimeoutConfig &timeouts, size_t maxFrameSize) {
  auto promise = std::make_shared<std::promise<std::shared_ptr<TlsConnection>>>();
  auto future = promise->get_future();
  asyncConnect(ioc, host, port, std::move(identity), timeouts, maxFrameSize,
               [promise, host, port](error_code ec, std::shared_ptr<TlsConnection> conn) {
                 if (ec) {
                   promise->set_exception(makeExceptionPtr(
                       ec, fmt::format("{}:{}: {}", host, port, ec.message())));
                 } else {
                   promise->set_value(std::move(conn));
                 }
               });
  return future.get();
}

void TlsConnection::start(const std::string &host, uint16_t port,
                          const TimeoutConfig &timeouts, ConnectHandler handler) {
  net::post(strand_, [self = shared_from_this(), host, port, timeouts,
                      handler = std::move(handler)]() mutable {
    if (self->state_ != State::Idle) {
      LOG_WARN("Connect requested in state {}", static_cast<int>(self->state_));
      handler(make_error_code(errc::cancelled), nullptr);
      return;
    }
    self->host_ = host;
    self->timeouts_ = timeouts;
    self->connectHandler_ = std::move(handler);
    self->state_ = State::Resolving;
    LOG_DEBUG("Connecting to {}:{}", host, port);
    self->armTimer(timeouts.connect);
    self->resolver_.async_resolve(
        host, std::to_string(port),
        net::bind_executor(self->strand_,
                           [self](const error_code &ec, tcp::resolver::results_type results) {
                             self->handleResolve(ec, results);
                           }));
  });
}

void TlsConnection::armTimer(std::chrono::milliseconds timeout) {
  ++timerGeneration_;
  timer_.expires_after(timeout);
  timer_.async_wait(net::bind_executor(
      strand_, [self = shared_from_this(), generation = timerGeneration_](const error_code &ec) {
        if (generation == self->timerGeneration_) {
          self->handleTimeout(ec);
        }
      }));
}

void TlsConnection::handleTimeout(const error_code &ec) {
  if (ec == net::error::operation_aborted) {
    return;
  }
  if (state_ == State::Open || state_ == State::Closed || state_ == State::Idle) {
    return;
  }
  LOG_WARN("Timed out connecting to {} (state {})", host_, static_cast<int>(state_));
  timedOut_ = true;
  resolver_.cancel();
  error_code ignored_ec;
  stream_.lowest_layer().close(ignored_ec);
}

void TlsConnection::handleResolve(const error_code &ec,
                                  const tcp::resolver::results_type &results) {
  if (state_ == State::Closed) {
    completeConnect(make_error_code(timedOut_ ? errc::timed_out : errc::cancelled));
    return;
  }
  if (ec) {
    LOG_ERROR("Cannot resolve {}: {}", host_, ec.message());
    completeConnect(make_error_code(timedOut_ ? errc::timed_out : errc::connect_failed));
    return;
  }
  state_ = State::Connecting;
  net::async_connect(stream_.lowest_layer(), results,
                     net::bind_executor(strand_, [self = shared_from_this()](
                                                     const error_code &ec,
                                                     const tcp::endpoint &endpoint) {
                       self->handleConnect(ec, endpoint);
                     }));
}

void TlsConnection::handleConnect(const error_code &ec, const tcp::endpoint &endpoint) {
  if (state_ == State::Closed && !timedOut_) {
    completeConnect(make_error_code(errc::cancelled));
    return;
  }
  if (ec) {
    LOG_ERROR("TCP connect to {} failed: {}", host_, ec.message());
    completeConnect(make_error_code(timedOut_ ? errc::timed_out : errc::connect_failed));
    return;
  }

  error_code opt_ec;
  stream_.lowest_layer().set_option(tcp::no_delay(true), opt_ec);
  if (opt_ec) {
    LOG_WARN("Failed to set TCP_NODELAY: {}", opt_ec.message());
  }

  remoteEndpoint_ = fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
  LOG_DEBUG("TCP connected to {}, starting TLS handshake", remoteEndpoint_);
  state_ = State::Handshaking;
  armTimer(timeouts_.tlsHandshake);
  stream_.async_handshake(
      net::ssl::stream_base::client,
      net::bind_executor(strand_, [self = shared_from_this()](const error_code &ec) {
        self->handleHandshake(ec);
      }));
}

void TlsConnection::handleHandshake(const error_code &ec) {
  if (state_ == State::Closed && !timedOut_) {
    completeConnect(make_error_code(errc::cancelled));
    return;
  }
  if (ec) {
    LOG_ERROR("TLS handshake with {} failed: {}", remoteEndpoint_, ec.message());
    completeConnect(make_error_code(timedOut_ ? errc::timed_out : errc::tls_failed));
    return;
  }

  peerCert_.reset(SSL_get1_peer_certificate(stream_.native_handle()));
  if (!peerCert_) {
    LOG_ERROR("Peer {} presented no certificate", remoteEndpoint_);
    completeConnect(make_error_code(errc::tls_failed));
    return;
  }
  LOG_INFO("TLS session established with {} (peer CN \"{}\")", remoteEndpoint_,
           Utils::certificateCommonName(peerCert_.get()));
  state_ = State::Open;
  open_.store(true);
  completeConnect({});
}

void TlsConnection::completeConnect(error_code ec) {
  ++timerGeneration_;
  timer_.cancel();
  if (ec && state_ != State::Closed) {
    state_ = State::Closed;
    open_.store(false);
    error_code ignored_ec;
    stream_.lowest_layer().close(ignored_ec);
  }
  auto handler = std::move(connectHandler_);
  connectHandler_ = nullptr;
  if (handler) {
    handler(ec, ec ? nullptr : shared_from_this());
  }
}

void TlsConnection::startReading(FrameHandler onFrame, ClosedHandler onClosed) {
  net::post(strand_, [self = shared_from_this(), onFrame = std::move(onFrame),
                      onClosed = std::move(onClosed)]() mutable {
    if (self->state_ != State::Open) {
      LOG_WARN("startReading on a connection that is not open");
      if (onClosed) {
        onClosed(net::error::not_connected);
      }
      return;
    }
    self->onFrame_ = std::move(onFrame);
    self->onClosed_ = std::move(onClosed);
    self->doRead();
  });
}

void TlsConnection::doRead() {
  stream_.async_read_some(
      net::buffer(readBuffer_),
      net::bind_executor(strand_, [self = shared_from_this()](const error_code &ec,
                                                              std::size_t bytes) {
        self->handleRead(ec, bytes);
      }));
}

void TlsConnection::handleRead(const error_code &ec, std::size_t bytes) {
  if (state_ != State::Open) {
    return;
  }

  if (bytes > 0) {
    LOG_VERBOSE("Read {} bytes from {}", bytes, remoteEndpoint_);
    decoder_.feed(readBuffer_.data(), bytes);
    try {
      while (state_ == State::Open) {
        auto payload = decoder_.next();
        if (!payload) {
          break;
        }
        if (onFrame_) {
          onFrame_(std::move(*payload));
        }
      }
    } catch (const FramingError &e) {
      LOG_ERROR("Bad frame from {}: {}", remoteEndpoint_, e.what());
      enterClosedState(make_error_code(errc::framing_error));
      return;
    }
  }

  if (ec) {
    error_code reason = ec;
    if (ec == net::error::eof || ec == net::ssl::error::stream_truncated) {
      if (decoder_.hasPartialFrame()) {
        LOG_ERROR("{} closed the connection inside a frame ({} bytes buffered)",
                  remoteEndpoint_, decoder_.bufferedBytes());
        reason = make_error_code(errc::framing_error);
      } else {
        reason = net::error::eof;
      }
    } else if (ec.category() == net::error::get_ssl_category()) {
      LOG_ERROR("TLS error from {}: {}", remoteEndpoint_, ec.message());
      reason = make_error_code(errc::tls_failed);
    }
    enterClosedState(reason);
    return;
  }

  if (state_ == State::Open) {
    doRead();
  }
}

void TlsConnection::send(std::vector<uint8_t> payload) {
  auto frame = Codec::encodeFrame(payload);
  net::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
    if (self->state_ != State::Open) {
      LOG_WARN("Dropping {} byte frame, connection to {} is not open", frame.size(),
               self->host_);
      return;
    }
    self->writeQueue_.push_back(std::move(frame));
    if (self->writeQueue_.size() == 1) {
      self->doWrite();
    }
  });
}

void TlsConnection::doWrite() {
  net::async_write(stream_, net::buffer(writeQueue_.front()),
                   net::bind_executor(strand_, [self = shared_from_this()](
                                                   const error_code &ec, std::size_t bytes) {
                     self->handleWrite(ec, bytes);
                   }));
}

void TlsConnection::handleWrite(const error_code &ec, std::size_t bytes) {
  if (state_ != State::Open) {
    return;
  }
  if (ec) {
    LOG_ERROR("Write to {} failed: {}", remoteEndpoint_, ec.message());
    enterClosedState(ec.category() == net::error::get_ssl_category()
                         ? make_error_code(errc::tls_failed)
                         : ec);
    return;
  }
  LOG_VERBOSE("Wrote {} bytes to {}", bytes, remoteEndpoint_);
  writeQueue_.pop_front();
  if (!writeQueue_.empty()) {
    doWrite();
  }
}

void TlsConnection::close() {
  net::post(strand_, [self = shared_from_this()]() {
    self->enterClosedState(net::error::operation_aborted);
  });
}

void TlsConnection::enterClosedState(error_code reason) {
  if (state_ == State::Closed) {
    return;
  }
  State previous_state = state_;
  state_ = State::Closed;
  open_.store(false);

  ++timerGeneration_;
  timer_.cancel();
  resolver_.cancel();
  error_code ignored_ec;
  stream_.lowest_layer().shutdown(tcp::socket::shutdown_both, ignored_ec);
  stream_.lowest_layer().close(ignored_ec);
  writeQueue_.clear();

  if (previous_state != State::Open) {
    // A connect in flight completes through its own handler.
    return;
  }

  LOG_INFO("Connection to {} closed: {}", remoteEndpoint_, reason.message());
  auto onClosed = std::move(onClosed_);
  onClosed_ = nullptr;
  onFrame_ = nullptr;
  if (onClosed) {
    onClosed(reason);
  }
}

} // namespace Transport
} // namespace AndroidTV

#pragma once

#include "ATVConfig.hpp"
#include "frameCodec.hpp"
#include "identityStore.hpp"
#include "logger.hpp"
#include <array>
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

namespace AndroidTV {
namespace Transport {

using FrameHandler = std::function<void(std::vector<uint8_t> payload)>;
// eof on an orderly close at a frame boundary, errc::framing_error when the
// stream ended mid-frame or carried a bad frame, errc::tls_failed on a TLS
// alert, operation_aborted after close().
using ClosedHandler = std::function<void(const error_code &ec)>;

// A framed, ordered, bidirectional message pipe. Both protocol state machines
// talk to the device through this; tests substitute an in-memory channel.
// Callbacks run on executor(); send() and close() may be called from any thread.
class MessageChannel {
  public:
    virtual ~MessageChannel() = default;

    virtual net::any_io_executor executor() = 0;

    // Queues one payload. The channel adds the length prefix. Writes leave
    // in call order.
    virtual void send(std::vector<uint8_t> payload) = 0;

    // Starts delivering complete payloads in arrival order. onClosed fires
    // exactly once, after which no more frames are delivered.
    virtual void startReading(FrameHandler onFrame, ClosedHandler onClosed) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual const X509 *peerCertificate() const = 0;
    virtual const X509 *localCertificate() const = 0;
    virtual std::string remoteEndpoint() const = 0;

    void sendMessage(const google::protobuf::MessageLite &message) {
        std::vector<uint8_t> payload(message.ByteSizeLong());
        if (!payload.empty() &&
            !message.SerializeToArray(payload.data(), static_cast<int>(payload.size()))) {
            throw FramingError("cannot serialize " + message.GetTypeName());
        }
        send(std::move(payload));
    }
};

// Builds the client TLS context presenting identity. Peer certificates are
// accepted unconditionally. Throws IdentityError if the PEM pair is rejected.
net::ssl::context makeClientContext(const Identity &identity);

// TCP + TLS client connection to a device port.
class TlsConnection : public MessageChannel,
                      public std::enable_shared_from_this<TlsConnection> {
    enum class State {
      Idle,        // Created, connect not started
      Resolving,   // Looking up the host
      Connecting,  // TCP connect in flight
      Handshaking, // TLS handshake in flight
      Open,        // Ready to send/receive
      Closed       // Closed locally or by error
    };

  public:
    using ConnectHandler =
        std::function<void(error_code ec, std::shared_ptr<TlsConnection> connection)>;

    TlsConnection(net::io_context &ioc, std::shared_ptr<const Identity> identity,
                  size_t maxFrameSize = Codec::kDefaultMaxFrameSize);
    ~TlsConnection() override;

    // Resolve, connect and handshake, each phase bounded by timeouts. The
    // returned connection can be close()d to abort. handler gets
    // errc::connect_failed, errc::tls_failed, errc::timed_out,
    // errc::cancelled or success.
    static std::shared_ptr<TlsConnection>
    asyncConnect(net::io_context &ioc, const std::string &host, uint16_t port,
                 std::shared_ptr<const Identity> identity, const TimeoutConfig &timeouts,
                 size_t maxFrameSize, ConnectHandler handler);

    // Blocking variant for callers outside the I/O thread. Throws the typed
    // exception for the failure. The io_context must be run by another thread.
    static std::shared_ptr<TlsConnection>
    connect(net::io_context &ioc, const std::string &host, uint16_t port,
            std::shared_ptr<const Identity> identity, const TimeoutConfig &timeouts,
            size_t maxFrameSize = Codec::kDefaultMaxFrameSize);

    net::any_io_executor executor() override { return strand_; }
    void send(std::vector<uint8_t> payload) override;
    void startReading(FrameHandler onFrame, ClosedHandler onClosed) override;
    void close() override;
    bool isOpen() const override { return open_.load(); }

    const X509 *peerCertificate() const override { return peerCert_.get(); }
    const X509 *localCertificate() const override { return identity_->certificate.get(); }
    std::string remoteEndpoint() const override { return remoteEndpoint_; }

  private:
    void start(const std::string &host, uint16_t port, const TimeoutConfig &timeouts,
               ConnectHandler handler);
    void armTimer(std::chrono::milliseconds timeout);
    void handleTimeout(const error_code &ec);
    void handleResolve(const error_code &ec, const tcp::resolver::results_type &results);
    void handleConnect(const error_code &ec, const tcp::endpoint &endpoint);
    void handleHandshake(const error_code &ec);
    void completeConnect(error_code ec);

    void doRead();
    void handleRead(const error_code &ec, std::size_t bytes);
    void doWrite();
    void handleWrite(const error_code &ec, std::size_t bytes);

    void enterClosedState(error_code reason);

    net::strand<net::io_context::executor_type> strand_;
    std::shared_ptr<const Identity> identity_;
    net::ssl::context sslContext_;
    net::ssl::stream<tcp::socket> stream_;
    tcp::resolver resolver_;
    net::steady_timer timer_;

    State state_ = State::Idle;
    std::atomic<bool> open_{false};
    bool timedOut_ = false;
    // Bumped on every re-arm so a stale expiry is ignored
    uint64_t timerGeneration_ = 0;
    TimeoutConfig timeouts_;
    ConnectHandler connectHandler_;

    std::string host_;
    std::string remoteEndpoint_;
    Utils::X509Ptr peerCert_;

    Codec::FrameDecoder decoder_;
    std::array<uint8_t, 16 * 1024> readBuffer_;
    std::deque<std::vector<uint8_t>> writeQueue_;
    FrameHandler onFrame_;
    ClosedHandler onClosed_;
};

} // namespace Transport
} // namespace AndroidTV

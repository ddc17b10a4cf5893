#include "ATVRemote.hpp"
#include "ATVErrors.hpp"
#include "ATVUtils.hpp"
#include "logger.hpp"

#include <boost/asio/post.hpp>
#include <chrono>
#include <condition_variable>
#include <future>
#include <stdexcept>

namespace AndroidTV {

using Pairing::PairingSession;
using Remote::RemoteSession;
using Transport::MessageChannel;
using Transport::TlsConnection;

ATVRemote::ATVRemote(ClientConfig config)
    : config_(std::move(config)), work_(boost::asio::make_work_guard(ioc_)),
      identityStore_(config_.storagePath, config_.clientName) {
  if (!Logger::getInstance().setLevel(config_.logLevel)) {
    LOG_WARN("Unknown log level '{}', keeping the current one", config_.logLevel);
  }
  worker_ = std::thread([this]() { ioc_.run(); });
  LOG_INFO("ATVRemote initialized ({}, storage {})", config_.clientName,
           config_.storagePath.string());
}

ATVRemote::~ATVRemote() { shutdown(); }

void ATVRemote::shutdown() {
  {
    std::lock_guard lock(sessionsMutex_);
    for (auto &weak : sessions_) {
      if (auto session = weak.lock()) {
        session->stop();
      }
    }
    sessions_.clear();
  }
  // Let the posted stops run before the loop goes down.
  std::promise<void> drained;
  auto done = drained.get_future();
  boost::asio::post(ioc_, [&drained]() { drained.set_value(); });
  if (done.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
    LOG_WARN("I/O thread did not drain in time");
  }
  work_.reset();
  ioc_.stop();
  if (worker_.joinable()) {
    worker_.join();
  }
  LOG_DEBUG("ATVRemote stopped");
}

std::shared_ptr<TlsConnection>
ATVRemote::asyncPair(const std::string &address, AsyncCodeHandler onCodeNeeded,
                     PairingSession::CompletionHandler onComplete) {
  auto identity = identityStore_.loadOrCreate();
  LOG_INFO("Connecting to {}:{} for pairing", address, config_.pairingPort);

  return TlsConnection::asyncConnect(
      ioc_, address, config_.pairingPort, identity, config_.timeouts, config_.maxFrameSize,
      [this, address, onCodeNeeded = std::move(onCodeNeeded),
       onComplete = std::move(onComplete)](error_code ec,
                                           std::shared_ptr<TlsConnection> connection) {
        if (ec) {
          LOG_ERROR("Cannot reach {}:{}: {}", address, config_.pairingPort, ec.message());
          onComplete(ec, std::nullopt);
          return;
        }

        std::shared_ptr<PairingSession> session;
        try {
          session = std::make_shared<PairingSession>(connection, address, config_);
        } catch (const Error &e) {
          LOG_ERROR("Cannot pair with {}: {}", address, e.what());
          connection->close();
          onComplete(e.code(), std::nullopt);
          return;
        }

        std::weak_ptr<PairingSession> weak = session;
        // The completion handler holds the session until the handshake ends.
        session->start(
            [weak, onCodeNeeded](const PairingEncoding &encoding) {
              if (auto s = weak.lock()) {
                onCodeNeeded(encoding, s);
              }
            },
            [this, session, onComplete](const error_code &ec, std::optional<PeerTrust> trust) {
              if (!ec && trust) {
                try {
                  identityStore_.savePeerTrust(*trust);
                } catch (const Error &e) {
                  LOG_ERROR("Paired with {} but cannot record it: {}", trust->address,
                            e.what());
                  onComplete(e.code(), std::nullopt);
                  return;
                }
              }
              onComplete(ec, std::move(trust));
            });
      });
}

PeerTrust ATVRemote::pair(const std::string &address, CodeProvider codeProvider) {
  struct PairWait {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<PairingEncoding> encoding;
    std::shared_ptr<PairingSession> session;
    bool done = false;
    error_code ec;
    std::optional<PeerTrust> trust;
  };
  auto wait = std::make_shared<PairWait>();

  asyncPair(
      address,
      [wait](const PairingEncoding &encoding, std::shared_ptr<PairingSession> session) {
        std::lock_guard lock(wait->mutex);
        wait->encoding = encoding;
        wait->session = std::move(session);
        wait->cv.notify_all();
      },
      [wait](const error_code &ec, std::optional<PeerTrust> trust) {
        std::lock_guard lock(wait->mutex);
        wait->done = true;
        wait->ec = ec;
        wait->trust = std::move(trust);
        wait->session.reset();
        wait->cv.notify_all();
      });

  std::unique_lock lock(wait->mutex);
  wait->cv.wait(lock, [&]() { return wait->done || wait->session; });
  if (!wait->done) {
    auto encoding = *wait->encoding;
    auto session = wait->session;
    lock.unlock();
    // The provider may block on user input; keep it off the I/O thread.
    std::optional<std::string> code;
    try {
      code = codeProvider(encoding);
    } catch (...) {
      session->cancel();
      throw;
    }
    if (code) {
      session->submitCode(*code);
    } else {
      session->cancel();
    }
    lock.lock();
    wait->cv.wait(lock, [&]() { return wait->done; });
  }

  if (wait->ec) {
    throwIfError(wait->ec, fmt::format("pairing with {} failed", address));
  }
  if (!wait->trust) {
    throw PairingError(fmt::format("pairing with {} ended without a result", address));
  }
  return *wait->trust;
}

std::shared_ptr<RemoteSession> ATVRemote::connect(const std::string &address,
                                                  Remote::RemoteCallbacks callbacks) {
  auto identity = identityStore_.loadOrCreate();
  auto trust = identityStore_.findPeerTrust(address);
  if (!trust) {
    LOG_WARN("{} has not been paired with this client", address);
  }

  auto factory = [this, address, identity](Remote::ChannelConnectHandler handler)
      -> std::shared_ptr<MessageChannel> {
    return TlsConnection::asyncConnect(
        ioc_, address, config_.controlPort, identity, config_.timeouts, config_.maxFrameSize,
        [handler = std::move(handler)](error_code ec, std::shared_ptr<TlsConnection> connection) {
          handler(ec, std::move(connection));
        });
  };
  auto session = std::make_shared<RemoteSession>(ioc_, std::move(factory), address, config_,
                                                 std::move(trust), std::move(callbacks));
  session->startAndWait();

  std::lock_guard lock(sessionsMutex_);
  std::erase_if(sessions_, [](const auto &weak) { return weak.expired(); });
  sessions_.push_back(session);
  return session;
}

std::pair<std::string, std::string> ATVRemote::getNameAndMac(const std::string &address) {
  auto identity = identityStore_.loadOrCreate();
  auto connection = TlsConnection::connect(ioc_, address, config_.controlPort, identity,
                                           config_.timeouts, config_.maxFrameSize);
  std::string commonName;
  try {
    commonName = Utils::certificateCommonName(connection->peerCertificate());
  } catch (const Error &) {
    connection->close();
    throw;
  }
  connection->close();
  LOG_DEBUG("Certificate subject of {}: {}", address, commonName);
  return parseNameAndMac(commonName);
}

std::pair<std::string, std::string> ATVRemote::parseNameAndMac(std::string_view commonName) {
  // e.g. atvremote/darcy/darcy/SHIELD Android TV/XX:XX:XX:XX:XX:XX
  auto last = commonName.rfind('/');
  if (last == std::string_view::npos || last == 0) {
    throw ProtocolError(fmt::format("unexpected certificate name '{}'", commonName));
  }
  auto previous = commonName.rfind('/', last - 1);
  auto nameStart = previous == std::string_view::npos ? 0 : previous + 1;
  return {std::string(commonName.substr(nameStart, last - nameStart)),
          std::string(commonName.substr(last + 1))};
}

int32_t ATVRemote::keyCodeFromName(std::string_view name) {
  std::string full(name);
  if (!full.starts_with("KEYCODE_")) {
    full = "KEYCODE_" + full;
  }
  remote::RemoteKeyCode code;
  if (!remote::RemoteKeyCode_Parse(full, &code)) {
    throw std::invalid_argument(fmt::format("unknown key code '{}'", name));
  }
  return static_cast<int32_t>(code);
}

} // namespace AndroidTV

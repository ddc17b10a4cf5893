#include "keepAliveManager.hpp"
#include "logger.hpp"

namespace AndroidTV {
namespace Remote {

KeepAliveManager::KeepAliveManager(boost::asio::any_io_executor executor,
                                   std::chrono::milliseconds timeout,
                                   SessionDiedDelegate session_died_delegate)
    : timeout_timer_(executor), timeout_(timeout),
      session_died_delegate_(std::move(session_died_delegate)) {
  LOG_DEBUG("KeepAliveManager created ({} ms)", timeout_.count());
  if (!session_died_delegate_) {
    LOG_WARN("Session Died Delegate is not set!");
  }
}

KeepAliveManager::~KeepAliveManager() {
  if (is_running_.load()) {
    stop();
  }
  LOG_VERBOSE("KeepAliveManager destroyed.");
}

void KeepAliveManager::start() {
  if (is_running_.exchange(true)) {
    LOG_WARN("Already running.");
    return;
  }
  LOG_DEBUG("Keep-alive monitoring started.");
  traffic_received();
}

void KeepAliveManager::stop() {
  if (!is_running_.exchange(false)) {
    return;
  }
  ++timer_generation_;
  timeout_timer_.cancel();
  LOG_DEBUG("Keep-alive monitoring stopped.");
}

void KeepAliveManager::traffic_received() {
  last_seen_alive_.store(std::chrono::steady_clock::now().time_since_epoch().count());
  if (!is_running_.load()) {
    return;
  }
  start_timeout_timer();
}

void KeepAliveManager::start_timeout_timer() {
  // cancel() is implied by expires_after; a handler already queued with
  // success is filtered by the generation.
  uint64_t generation = ++timer_generation_;
  timeout_timer_.expires_after(timeout_);
  LOG_VERBOSE("Timeout timer set for {} ms.", timeout_.count());

  timeout_timer_.async_wait(
      [weak = std::weak_ptr<KeepAliveManager>(shared_from_this()),
       generation](const boost::system::error_code &ec) {
        if (auto self = weak.lock()) {
          self->handle_timeout(ec, generation);
        }
      });
}

void KeepAliveManager::handle_timeout(const boost::system::error_code &ec,
                                      uint64_t generation) {
  if (ec == boost::asio::error::operation_aborted || generation != timer_generation_) {
    return;
  }
  if (!is_running_.load()) {
    return;
  }

  if (ec) {
    LOG_ERROR("Keep-alive timer error: {}", ec.message());
  } else {
    LOG_ERROR("Keep alive timeout! No traffic received within {} ms.", timeout_.count());
  }

  is_running_.store(false);
  LOG_INFO("Invoking Session Died delegate due to timeout/error.");
  if (session_died_delegate_) {
    session_died_delegate_();
  }
}

} // namespace Remote
} // namespace AndroidTV

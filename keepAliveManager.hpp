#ifndef ATV_KEEP_ALIVE_MANAGER_H
#define ATV_KEEP_ALIVE_MANAGER_H

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace AndroidTV {
namespace Remote {
// Delegate type for session died notification
using SessionDiedDelegate = std::function<void()>;

// Watches the control connection for inbound traffic. The device pings every
// 5 seconds; silence longer than the timeout means the peer is gone. This
// side never pings.
class KeepAliveManager : public std::enable_shared_from_this<KeepAliveManager> {
  public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{16000};

    // executor must be the session strand: the delegate runs there.
    KeepAliveManager(boost::asio::any_io_executor executor,
                     std::chrono::milliseconds timeout = kDefaultTimeout,
                     SessionDiedDelegate session_died_delegate = []() {});

    ~KeepAliveManager();

    KeepAliveManager(const KeepAliveManager &) = delete;
    KeepAliveManager &operator=(const KeepAliveManager &) = delete;
    KeepAliveManager(KeepAliveManager &&) = delete;
    KeepAliveManager &operator=(KeepAliveManager &&) = delete;

    void start();
    void stop();

    // Pushes the deadline out by one timeout. Call on every inbound message.
    void traffic_received();

    bool is_running() const { return is_running_.load(); }
    std::chrono::steady_clock::time_point last_seen_alive() const {
        return std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(last_seen_alive_.load()));
    }
    std::chrono::milliseconds timeout() const { return timeout_; }

  private:
    void start_timeout_timer();
    void handle_timeout(const boost::system::error_code &ec, uint64_t generation);

    boost::asio::steady_timer timeout_timer_;
    std::chrono::milliseconds timeout_;
    uint64_t timer_generation_ = 0;
    std::atomic<bool> is_running_{false};
    std::atomic<std::chrono::steady_clock::rep> last_seen_alive_{0};
    SessionDiedDelegate session_died_delegate_;
};

} // namespace Remote
} // namespace AndroidTV

#endif // ATV_KEEP_ALIVE_MANAGER_H

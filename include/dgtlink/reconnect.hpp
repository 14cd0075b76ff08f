/**
 * @file reconnect.hpp
 * @brief Keep a Connection connected: retry with exponential backoff.
 *
 * @details
 * ReconnectSupervisor calls Connection::connect_once() until it succeeds.
 * After each failed pass over all candidates it waits, doubling the delay
 * from `initial` up to `max`:
 *
 * @code
 *   attempt ─fail─▶ wait 0.5 s ─▶ attempt ─fail─▶ wait 1 s ─▶ ... wait max ─▶ ...
 *      │
 *      └─ok─▶ idle until `disconnected` ─▶ attempt (backoff starts over)
 * @endcode
 *
 * `closed` stops it for good, including a pending wait.
 */
#ifndef DGTLINK_RECONNECT_HPP
#define DGTLINK_RECONNECT_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "dgtlink/connection.hpp"
#include "dgtlink/event_loop.hpp"
#include "dgtlink/events.hpp"

namespace dgtlink {

/// Delay sequence initial, min(2*initial, max), min(4*initial, max), ...
/// The first wait is always @p initial, even when @p max is smaller.
class Backoff {
public:
  Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max)
  : initial_(initial), max_(max), next_(initial_) {}

  /// Delay to wait now; advances the sequence.
  std::chrono::milliseconds next() {
    const auto d = next_;
    next_ = std::min<std::chrono::milliseconds>(next_ * 2, max_);
    return d;
  }

  void reset() { next_ = initial_; }

  std::chrono::milliseconds initial() const { return initial_; }
  std::chrono::milliseconds max() const { return max_; }

private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds max_;
  std::chrono::milliseconds next_;
};

struct ReconnectOptions {
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{10000};
  /// Called with every delay just before it is scheduled.
  std::function<void(std::chrono::milliseconds)> on_backoff;
};

class ReconnectSupervisor {
public:
  ReconnectSupervisor(Connection& conn, EventLoop& loop, ReconnectOptions opts = {});
  ~ReconnectSupervisor();

  ReconnectSupervisor(const ReconnectSupervisor&) = delete;
  ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

  /// Schedule the first attempt (on the next loop iteration).
  void start();

  /// Stop retrying without closing the connection.
  void stop();

  bool running() const { return running_; }
  bool waiting() const { return timer_.has_value(); }
  unsigned attempts() const { return attempts_; }

private:
  void schedule(std::chrono::milliseconds delay);
  void attempt();

  Connection& conn_;
  EventLoop& loop_;
  ReconnectOptions opts_;
  Backoff backoff_;

  EventHub::Id on_disconnected_{0};
  EventHub::Id on_closed_{0};
  std::optional<EventLoop::TimerId> timer_;
  bool running_{false};
  unsigned attempts_{0};
};

/**
 * @brief Build a Connection and keep it connected.
 *
 * The supervisor refers to the connection and is declared after it, so it
 * is destroyed first. The first attempt runs on the next loop iteration.
 */
struct AutoConnection {
  std::unique_ptr<Connection> connection;
  std::unique_ptr<ReconnectSupervisor> supervisor;
};

AutoConnection auto_connect(EventLoop& loop, ConnectionOptions conn_opts,
                            ReconnectOptions reconnect_opts = {});

} // namespace dgtlink

#endif // DGTLINK_RECONNECT_HPP

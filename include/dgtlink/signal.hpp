/**
 * @file signal.hpp
 * @brief Suspension primitives for the control loop: a resettable one-shot signal and a FIFO lock.
 *
 * @details
 * The board protocol has no request ids. "Get version" is answered by the
 * next version message, whoever asked for it. `PendingSignal` models exactly
 * that: the connection clears it before sending a request and sets it when the
 * matching message is interpreted; every waiter at that moment is released.
 * Two concurrent identical queries are therefore both satisfied by the same
 * response, which is the device's behavior and not corrected here.
 *
 * Handlers are never run from inside set()/fail(): they are posted to the loop
 * with call_soon(), so a handler can safely issue new requests or close the
 * connection.
 */
#ifndef DGTLINK_SIGNAL_HPP
#define DGTLINK_SIGNAL_HPP

#include <deque>
#include <vector>

#include "dgtlink/event_loop.hpp"
#include "dgtlink/status.hpp"

namespace dgtlink {

class PendingSignal {
public:
  explicit PendingSignal(EventLoop& loop) : loop_(loop) {}

  PendingSignal(const PendingSignal&) = delete;
  PendingSignal& operator=(const PendingSignal&) = delete;

  /// Arm for a new request. Current waiters keep waiting.
  void clear() { set_ = false; }

  /// Mark as fired and release every waiter with Status::Ok.
  void set();

  /// Release every waiter with @p status; the signal stays cleared.
  void fail(Status status);

  /// Terminal: release waiters with Status::Closed and fail all future waits.
  void close();

  /**
   * @brief Resume @p h when the signal fires.
   *
   * Already set: @p h runs on the next loop turn with Ok. Closed: with Closed.
   */
  void wait(DoneHandler h);

  bool is_set() const { return set_; }
  bool is_closed() const { return closed_; }
  size_t waiting() const { return waiters_.size(); }

private:
  void release(Status status);

  EventLoop& loop_;
  std::vector<DoneHandler> waiters_;
  bool set_{false};
  bool closed_{false};
};

/**
 * @brief Cooperative FIFO mutex: only one clock command is in flight at a time.
 *
 * `lock(h)` resumes @p h with Ok once the caller owns the lock; the owner must
 * call unlock(). Queued lockers are resumed in request order.
 */
class AsyncMutex {
public:
  explicit AsyncMutex(EventLoop& loop) : loop_(loop) {}

  AsyncMutex(const AsyncMutex&) = delete;
  AsyncMutex& operator=(const AsyncMutex&) = delete;

  void lock(DoneHandler h);
  void unlock();

  /// Fail queued lockers with Closed and refuse new ones.
  void close();

  bool locked() const { return locked_; }
  size_t waiting() const { return queue_.size(); }

private:
  EventLoop& loop_;
  std::deque<DoneHandler> queue_;
  bool locked_{false};
  bool closed_{false};
};

} // namespace dgtlink

#endif // DGTLINK_SIGNAL_HPP

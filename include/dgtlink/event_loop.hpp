/**
 * @file event_loop.hpp
 * @brief Single-threaded poll(2) reactor: fd readiness callbacks, timers and posted tasks.
 *
 * @details
 * Everything that mutates connection, board or clock state runs on one
 * `EventLoop`. The reactor driver hangs its serial fd on it; the threaded
 * driver posts frames and errors back to it with `call_soon_threadsafe()`;
 * queries and clock commands "suspend" by leaving a callback behind and
 * returning, to be resumed by a later task.
 *
 * @par One iteration
 * ```
 *   run due timers -> run posted tasks -> poll(fds + wake pipe, until next timer)
 *                  -> dispatch readable, then writable callbacks
 * ```
 * Callbacks may add or remove registrations, post tasks, or stop the loop.
 * A registration removed during an iteration is not called afterwards in that
 * same iteration.
 *
 * @par Threads
 * Only `call_soon_threadsafe()` and `stop()` may be called from other threads.
 */
#ifndef DGTLINK_EVENT_LOOP_HPP
#define DGTLINK_EVENT_LOOP_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace dgtlink {

class EventLoop {
public:
  using Task     = std::function<void()>;
  using TimerId  = uint64_t;
  using Clock    = std::chrono::steady_clock;

  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  /// Call @p cb whenever @p fd is readable (or hung up). Replaces an existing reader.
  void add_reader(int fd, Task cb);
  void remove_reader(int fd);
  bool has_reader(int fd) const { return readers_.count(fd) != 0; }

  /// Call @p cb whenever @p fd is writable. Replaces an existing writer.
  void add_writer(int fd, Task cb);
  void remove_writer(int fd);
  bool has_writer(int fd) const { return writers_.count(fd) != 0; }

  /// Run @p task on the next iteration, after the current callback returns.
  void call_soon(Task task);

  /// Same as call_soon() but safe from any thread; wakes a blocked poll.
  void call_soon_threadsafe(Task task);

  /// Run @p task once after @p delay. Returns an id usable with cancel().
  TimerId call_later(std::chrono::milliseconds delay, Task task);

  /// Cancel a pending timer. Unknown or already-fired ids are ignored.
  void cancel(TimerId id);

  /// Run until stop() is called.
  void run();

  /**
   * @brief Run until @p done returns true or @p timeout elapses.
   * @return the final value of @p done().
   */
  bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

  /// One iteration, blocking in poll for at most @p max_wait.
  void run_once(std::chrono::milliseconds max_wait);

  /// Ask run() to return after the current iteration. Thread-safe.
  void stop();

  size_t pending_timers() const { return timers_.size(); }

private:
  void run_due_timers();
  void run_posted();
  void drain_wake_pipe();
  void wake();

  struct Timer {
    TimerId id;
    Task task;
  };

  std::map<int, Task> readers_;
  std::map<int, Task> writers_;
  std::multimap<Clock::time_point, Timer> timers_;
  std::map<TimerId, Clock::time_point> timer_index_;
  TimerId next_timer_{1};

  std::deque<Task> posted_;              ///< loop-thread only
  std::mutex remote_mu_;
  std::deque<Task> remote_;              ///< filled from other threads

  int wake_rd_{-1};
  int wake_wr_{-1};
  std::atomic<bool> stop_{false};
};

} // namespace dgtlink

#endif // DGTLINK_EVENT_LOOP_HPP

/**
 * @file threaded_driver.hpp
 * @brief Blocking driver: one read thread, one write thread, results marshaled to the loop.
 *
 * @details
 * For transports that cannot be polled for readiness. The read thread blocks
 * in recv() for the 3-byte header, then for the declared payload, and posts
 * each complete frame to the loop. It never polls the descriptor: a blocking
 * recv() returns after at most one read slice, which is when the thread
 * notices shutdown. The write thread drains a locked queue; an empty entry is
 * the shutdown sentinel.
 *
 * Every session gets a generation number. Frames or errors posted by the
 * threads of an earlier session are discarded on arrival, so a late error
 * from a dead link cannot tear down a fresh one.
 */
#ifndef DGTLINK_THREADED_DRIVER_HPP
#define DGTLINK_THREADED_DRIVER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "dgtlink/driver.hpp"

namespace dgtlink {

class ThreadedDriver : public IDriver {
public:
  ThreadedDriver(EventLoop& loop, FrameSink on_frame, ErrorSink on_error);
  ~ThreadedDriver() override;

  bool configure(transport::ITransport& t) override;
  void connect(transport::ITransport& t) override;
  void disconnect() override;
  void write(const std::vector<uint8_t>& bytes) override;
  bool active() const override { return running_.load(); }
  DriverKind kind() const override { return DriverKind::Threaded; }

private:
  using Item = std::optional<std::vector<uint8_t>>;   // nullopt = shutdown

  void read_loop(transport::ITransport* t, uint64_t gen);
  void write_loop(transport::ITransport* t, uint64_t gen);
  void post_frame(Frame frame, uint64_t gen);
  void post_error(const std::string& reason, uint64_t gen);

  EventLoop& loop_;
  FrameSink on_frame_;
  ErrorSink on_error_;

  std::atomic<bool> running_{false};
  uint64_t generation_{0};                 ///< loop thread only

  std::thread reader_;
  std::thread writer_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Item> queue_;

  std::shared_ptr<int> alive_{std::make_shared<int>(0)};
};

} // namespace dgtlink

#endif // DGTLINK_THREADED_DRIVER_HPP

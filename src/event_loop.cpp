// ============================================================================
// event_loop.cpp: implementation for event_loop.hpp
// ============================================================================
#include "dgtlink/event_loop.hpp"
#include "dgtlink/log.hpp"

#include <fcntl.h>         // O_NONBLOCK, O_CLOEXEC for the wake pipe
#include <poll.h>          // poll(2)
#include <unistd.h>        // pipe2, read, write, close

#include <cerrno>
#include <cstring>         // strerror
#include <stdexcept>
#include <vector>

namespace dgtlink {

EventLoop::EventLoop() {
  int fds[2];
  if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0)
    throw std::runtime_error(std::string("event loop wake pipe: ") + std::strerror(errno));
  wake_rd_ = fds[0];
  wake_wr_ = fds[1];
}

EventLoop::~EventLoop() {
  if (wake_rd_ >= 0) ::close(wake_rd_);
  if (wake_wr_ >= 0) ::close(wake_wr_);
}

// ---------- registrations ----------

void EventLoop::add_reader(int fd, Task cb)  { readers_[fd] = std::move(cb); }
void EventLoop::remove_reader(int fd)        { readers_.erase(fd); }
void EventLoop::add_writer(int fd, Task cb)  { writers_[fd] = std::move(cb); }
void EventLoop::remove_writer(int fd)        { writers_.erase(fd); }

// ---------- tasks & timers ----------

void EventLoop::call_soon(Task task) {
  posted_.push_back(std::move(task));
}

void EventLoop::call_soon_threadsafe(Task task) {
  {
    std::lock_guard<std::mutex> lk(remote_mu_);
    remote_.push_back(std::move(task));
  }
  wake();
}

EventLoop::TimerId EventLoop::call_later(std::chrono::milliseconds delay, Task task) {
  const TimerId id = next_timer_++;
  const auto when = Clock::now() + delay;
  timers_.emplace(when, Timer{id, std::move(task)});
  timer_index_[id] = when;
  return id;
}

void EventLoop::cancel(TimerId id) {
  auto idx = timer_index_.find(id);
  if (idx == timer_index_.end()) return;
  auto range = timers_.equal_range(idx->second);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second.id == id) { timers_.erase(it); break; }
  }
  timer_index_.erase(idx);
}

void EventLoop::run_due_timers() {
  const auto now = Clock::now();
  // Collect first: a timer task may schedule or cancel other timers.
  std::vector<Task> due;
  while (!timers_.empty() && timers_.begin()->first <= now) {
    auto it = timers_.begin();
    timer_index_.erase(it->second.id);
    due.push_back(std::move(it->second.task));
    timers_.erase(it);
  }
  for (auto& t : due) t();
}

void EventLoop::run_posted() {
  {
    std::lock_guard<std::mutex> lk(remote_mu_);
    while (!remote_.empty()) {
      posted_.push_back(std::move(remote_.front()));
      remote_.pop_front();
    }
  }
  // Only what is queued now; tasks posted by these tasks wait for the next turn.
  std::deque<Task> batch;
  batch.swap(posted_);
  for (auto& t : batch) t();
}

void EventLoop::wake() {
  const uint8_t b = 1;
  // EAGAIN means the pipe is already full, which is as good as a wakeup.
  if (::write(wake_wr_, &b, 1) < 0 && errno != EAGAIN)
    log::error("event loop wake failed").kv("errno", std::strerror(errno));
}

void EventLoop::drain_wake_pipe() {
  uint8_t buf[64];
  while (::read(wake_rd_, buf, sizeof(buf)) > 0) {}
}

// ---------- running ----------

void EventLoop::run_once(std::chrono::milliseconds max_wait) {
  run_due_timers();
  run_posted();

  // Sleep no longer than the next timer, and not at all if work is queued.
  auto wait = max_wait;
  if (!timers_.empty()) {
    auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
        timers_.begin()->first - Clock::now());
    if (until < std::chrono::milliseconds(0)) until = std::chrono::milliseconds(0);
    if (until < wait) wait = until;
  }
  {
    std::lock_guard<std::mutex> lk(remote_mu_);
    if (!posted_.empty() || !remote_.empty()) wait = std::chrono::milliseconds(0);
  }
  if (stop_.load()) wait = std::chrono::milliseconds(0);

  std::vector<pollfd> pfds;
  pfds.reserve(readers_.size() + writers_.size() + 1);
  pfds.push_back(pollfd{wake_rd_, POLLIN, 0});
  for (const auto& r : readers_) pfds.push_back(pollfd{r.first, POLLIN, 0});
  for (const auto& w : writers_) {
    bool merged = false;
    for (auto& p : pfds) {
      if (p.fd == w.first && p.fd != wake_rd_) { p.events |= POLLOUT; merged = true; break; }
    }
    if (!merged) pfds.push_back(pollfd{w.first, POLLOUT, 0});
  }

  const int pr = ::poll(pfds.data(), pfds.size(), static_cast<int>(wait.count()));
  if (pr < 0) {
    if (errno != EINTR) log::error("poll failed").kv("errno", std::strerror(errno));
    return;
  }
  if (pr == 0) return;

  if (pfds[0].revents & POLLIN) drain_wake_pipe();

  // Readable first (error/hangup is reported to the reader so it can see EOF).
  for (size_t i = 1; i < pfds.size(); ++i) {
    const short ev = pfds[i].revents;
    if (!(ev & (POLLIN | POLLHUP | POLLERR | POLLNVAL))) continue;
    auto it = readers_.find(pfds[i].fd);
    if (it == readers_.end()) continue;             // removed by an earlier callback
    Task cb = it->second;                           // copy: callback may unregister itself
    cb();
  }
  for (size_t i = 1; i < pfds.size(); ++i) {
    const short ev = pfds[i].revents;
    if (!(ev & (POLLOUT | POLLERR | POLLHUP))) continue;
    auto it = writers_.find(pfds[i].fd);
    if (it == writers_.end()) continue;
    Task cb = it->second;
    cb();
  }
}

void EventLoop::run() {
  stop_.store(false);
  while (!stop_.load()) run_once(std::chrono::milliseconds(1000));
}

bool EventLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;
  stop_.store(false);
  while (!done()) {
    const auto now = Clock::now();
    if (now >= deadline || stop_.load()) break;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (left > std::chrono::milliseconds(50)) left = std::chrono::milliseconds(50);
    run_once(left);
  }
  return done();
}

void EventLoop::stop() {
  stop_.store(true);
  wake();
}

} // namespace dgtlink

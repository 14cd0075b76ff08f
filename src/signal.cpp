#include "dgtlink/signal.hpp"

#include <utility>

namespace dgtlink {

// ---------- PendingSignal ----------

void PendingSignal::release(Status status) {
  std::vector<DoneHandler> waiters;
  waiters.swap(waiters_);
  for (auto& h : waiters) {
    loop_.call_soon([h, status] { h(status); });
  }
}

void PendingSignal::set() {
  set_ = true;
  release(Status::Ok);
}

void PendingSignal::fail(Status status) {
  set_ = false;
  release(status);
}

void PendingSignal::close() {
  closed_ = true;
  set_ = false;
  release(Status::Closed);
}

void PendingSignal::wait(DoneHandler h) {
  if (closed_) {
    loop_.call_soon([h] { h(Status::Closed); });
  } else if (set_) {
    loop_.call_soon([h] { h(Status::Ok); });
  } else {
    waiters_.push_back(std::move(h));
  }
}

// ---------- AsyncMutex ----------

void AsyncMutex::lock(DoneHandler h) {
  if (closed_) {
    loop_.call_soon([h] { h(Status::Closed); });
    return;
  }
  if (!locked_) {
    locked_ = true;
    loop_.call_soon([h] { h(Status::Ok); });
    return;
  }
  queue_.push_back(std::move(h));
}

void AsyncMutex::unlock() {
  if (queue_.empty()) {
    locked_ = false;
    return;
  }
  // Ownership passes straight to the next locker; locked_ stays true.
  DoneHandler next = std::move(queue_.front());
  queue_.pop_front();
  loop_.call_soon([next] { next(Status::Ok); });
}

void AsyncMutex::close() {
  closed_ = true;
  std::deque<DoneHandler> q;
  q.swap(queue_);
  for (auto& h : q) loop_.call_soon([h] { h(Status::Closed); });
}

} // namespace dgtlink

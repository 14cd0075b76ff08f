// ============================================================================
// reconnect.cpp: implementation for reconnect.hpp
// ============================================================================
#include "dgtlink/reconnect.hpp"
#include "dgtlink/log.hpp"

#include <utility>

namespace dgtlink {

ReconnectSupervisor::ReconnectSupervisor(Connection& conn, EventLoop& loop, ReconnectOptions opts)
: conn_(conn),
  loop_(loop),
  opts_(std::move(opts)),
  backoff_(opts_.initial_backoff, opts_.max_backoff) {
  on_disconnected_ = conn_.events().on_disconnected([this] {
    if (running_ && !conn_.closed()) {
      log::debug("reconnect scheduled");
      backoff_.reset();
      schedule(std::chrono::milliseconds(0));
    }
  });
  on_closed_ = conn_.events().on_closed([this] { stop(); });
}

ReconnectSupervisor::~ReconnectSupervisor() {
  stop();
  conn_.events().remove(on_disconnected_);
  conn_.events().remove(on_closed_);
}

void ReconnectSupervisor::start() {
  if (running_ || conn_.closed()) return;
  running_ = true;
  backoff_.reset();
  schedule(std::chrono::milliseconds(0));
}

void ReconnectSupervisor::stop() {
  running_ = false;
  if (timer_) {
    loop_.cancel(*timer_);
    timer_.reset();
  }
}

// One timer at a time: a disconnect during a pending wait does not stack a second one.
void ReconnectSupervisor::schedule(std::chrono::milliseconds delay) {
  if (timer_) return;
  if (delay.count() > 0 && opts_.on_backoff) opts_.on_backoff(delay);
  timer_ = loop_.call_later(delay, [this] {
    timer_.reset();
    attempt();
  });
}

void ReconnectSupervisor::attempt() {
  if (!running_) return;
  if (conn_.closed()) { running_ = false; return; }
  if (conn_.connected()) return;

  ++attempts_;
  log::debug("trying to connect").kv("attempt", attempts_);
  if (conn_.connect_once()) {
    backoff_.reset();
    return;
  }
  // connect_once() may have run a handler that closed the connection.
  if (!running_ || conn_.closed()) return;

  const auto delay = backoff_.next();
  log::debug("no board, retrying").kv("delay_ms", delay.count());
  schedule(delay);
}

AutoConnection auto_connect(EventLoop& loop, ConnectionOptions conn_opts,
                            ReconnectOptions reconnect_opts) {
  AutoConnection ac;
  ac.connection = std::make_unique<Connection>(loop, std::move(conn_opts));
  ac.supervisor = std::make_unique<ReconnectSupervisor>(*ac.connection, loop,
                                                        std::move(reconnect_opts));
  ac.supervisor->start();
  return ac;
}

} // namespace dgtlink

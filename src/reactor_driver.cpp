// ============================================================================
// reactor_driver.cpp: implementation for reactor_driver.hpp
// ============================================================================
#include "dgtlink/reactor_driver.hpp"
#include "dgtlink/commands.hpp"   // hex_dump()
#include "dgtlink/log.hpp"

namespace dgtlink {

using transport::RxResult;
using transport::TxResult;

ReactorDriver::ReactorDriver(EventLoop& loop, FrameSink on_frame, ErrorSink on_error)
: loop_(loop), on_frame_(std::move(on_frame)), on_error_(std::move(on_error)) {}

ReactorDriver::~ReactorDriver() {
  disconnect();
}

bool ReactorDriver::configure(transport::ITransport& t) {
  if (!t.supports_readiness() || t.fd() < 0) {
    log::warn("transport cannot be polled").kv("transport", t.name());
    return false;
  }
  return t.set_blocking(false);
}

void ReactorDriver::connect(transport::ITransport& t) {
  disconnect();                                   // never serve two fds at once
  t_  = &t;
  fd_ = t.fd();
  decoder_.reset();
  out_.clear();
  loop_.add_reader(fd_, [this] { can_read(); });
}

void ReactorDriver::disconnect() {
  if (fd_ >= 0) {
    loop_.remove_reader(fd_);
    loop_.remove_writer(fd_);
  }
  t_  = nullptr;
  fd_ = -1;
  decoder_.reset();                               // a partial frame is never delivered
  out_.clear();
}

// ---------------------------------------------------------------------------
// can_read()
// ----------
// Exactly one non-blocking read per readiness notification, sized to what the
// decoder still needs so the header is never over-read into the payload.
// ---------------------------------------------------------------------------
void ReactorDriver::can_read() {
  if (!t_) return;

  const size_t want = decoder_.wanted();
  rbuf_.resize(want);
  size_t n = 0;
  const RxResult r = t_->recv(rbuf_.data(), want, n);

  if (r == RxResult::None) return;                // spurious wakeup
  if (r == RxResult::Closed) { fail("end of stream"); return; }
  if (r == RxResult::Error)  { fail("read error"); return; }

  std::vector<Frame> frames;
  if (decoder_.feed(rbuf_.data(), n, frames) == FrameDecoder::Result::BadLength) {
    fail("bad frame length " + std::to_string(decoder_.last_bad_length()));
    return;
  }
  for (const auto& f : frames) {
    on_frame_(f);
    if (!t_) return;                              // a handler disconnected us
  }
}

void ReactorDriver::write(const std::vector<uint8_t>& bytes) {
  if (!t_) {
    log::debug("write dropped, not connected").kvq("bytes", hex_dump(bytes));
    return;
  }
  if (bytes.empty()) return;

  // Start the writer only on the empty -> non-empty transition.
  const bool was_idle = out_.empty();
  out_.insert(out_.end(), bytes.begin(), bytes.end());
  if (was_idle) loop_.add_writer(fd_, [this] { can_write(); });
}

void ReactorDriver::can_write() {
  if (!t_) return;

  size_t written = 0;
  const TxResult r = out_.empty() ? TxResult::Ok : t_->send(out_.data(), out_.size(), written);

  if (r == TxResult::Error) {
    fail("write error");
    return;
  }
  if (r == TxResult::Ok && written > 0) {
    log::debug("sent").kvq("bytes", hex_dump(out_.data(), written));
    out_.erase(out_.begin(), out_.begin() + static_cast<std::ptrdiff_t>(written));
  }

  // Drained: stop asking for writability or the loop would spin.
  if (out_.empty()) loop_.remove_writer(fd_);
}

void ReactorDriver::fail(const std::string& reason) {
  log::error("serial i/o failed").kvq("reason", reason);
  const int fd = fd_;
  if (fd >= 0) {
    loop_.remove_reader(fd);
    loop_.remove_writer(fd);
  }
  on_error_(reason);
}

} // namespace dgtlink

// ============================================================================
// threaded_driver.cpp: implementation for threaded_driver.hpp
//
// Threading rules:
//   - read_loop/write_loop own nothing but the transport calls and their queue.
//   - Everything they learn goes through loop_.call_soon_threadsafe().
//   - generation_ is only read and written on the loop thread; the threads get
//     their generation by value when they start.
// ============================================================================
#include "dgtlink/threaded_driver.hpp"
#include "dgtlink/commands.hpp"   // hex_dump()
#include "dgtlink/log.hpp"

#include <chrono>
#include <thread>

namespace dgtlink {

using transport::RxResult;
using transport::TxResult;

ThreadedDriver::ThreadedDriver(EventLoop& loop, FrameSink on_frame, ErrorSink on_error)
: loop_(loop), on_frame_(std::move(on_frame)), on_error_(std::move(on_error)) {}

ThreadedDriver::~ThreadedDriver() {
  disconnect();
  alive_.reset();                                 // drop anything still queued on the loop
}

bool ThreadedDriver::configure(transport::ITransport& t) {
  return t.set_blocking(true);
}

void ThreadedDriver::connect(transport::ITransport& t) {
  if (running_.load()) return;

  // Fresh session: empty queue, new generation.
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.clear();
  }

  const uint64_t gen = ++generation_;
  running_.store(true);
  writer_ = std::thread(&ThreadedDriver::write_loop, this, &t, gen);
  reader_ = std::thread(&ThreadedDriver::read_loop, this, &t, gen);
}

void ThreadedDriver::disconnect() {
  if (!running_.exchange(false)) return;
  ++generation_;                                  // orphan anything still in flight

  // The write loop wakes on the sentinel; the read loop sees running_ == false
  // once its current read slice ends.
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.clear();
    queue_.push_back(std::nullopt);
  }
  cv_.notify_all();

  if (reader_.joinable()) reader_.join();
  if (writer_.joinable()) writer_.join();
}

void ThreadedDriver::write(const std::vector<uint8_t>& bytes) {
  if (!running_.load()) {
    log::debug("write dropped, not connected").kvq("bytes", hex_dump(bytes));
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(bytes);
  }
  cv_.notify_one();
}

// ---------------------------------------------------------------------------
// Hand-off to the loop thread. The alive token keeps posted tasks from
// touching a destroyed driver; the generation check drops stale sessions.
// ---------------------------------------------------------------------------
void ThreadedDriver::post_frame(Frame frame, uint64_t gen) {
  std::weak_ptr<int> alive = alive_;
  loop_.call_soon_threadsafe([this, alive, gen, frame = std::move(frame)] {
    if (!alive.lock() || gen != generation_) return;
    on_frame_(frame);
  });
}

void ThreadedDriver::post_error(const std::string& reason, uint64_t gen) {
  log::error("serial i/o failed").kvq("reason", reason);
  std::weak_ptr<int> alive = alive_;
  loop_.call_soon_threadsafe([this, alive, gen, reason] {
    if (!alive.lock() || gen != generation_) return;
    on_error_(reason);
  });
}

// ---------------------------------------------------------------------------
// read_loop()
// -----------
// Blocks in recv() for the header, then for the declared payload (the
// decoder's wanted() drives the read size), and posts each finished frame.
// RxResult::None is an elapsed read slice: check for shutdown, read again.
// ---------------------------------------------------------------------------
void ThreadedDriver::read_loop(transport::ITransport* t, uint64_t gen) {
  FrameDecoder decoder;
  std::vector<uint8_t> buf;

  while (running_.load()) {
    const size_t want = decoder.wanted();
    buf.resize(want);
    size_t n = 0;
    const RxResult r = t->recv(buf.data(), want, n);
    if (r == RxResult::None) continue;
    if (r != RxResult::Ok) {
      if (running_.load()) post_error(r == RxResult::Closed ? "end of stream" : "read error", gen);
      return;
    }

    std::vector<Frame> frames;
    if (decoder.feed(buf.data(), n, frames) == FrameDecoder::Result::BadLength) {
      post_error("bad frame length " + std::to_string(decoder.last_bad_length()), gen);
      return;
    }
    for (auto& f : frames) post_frame(std::move(f), gen);
  }
}

// ---------------------------------------------------------------------------
// write_loop()
// ------------
// Drains the queue until the sentinel. A blocking transport normally takes
// the whole buffer; short writes and Busy are retried.
// ---------------------------------------------------------------------------
void ThreadedDriver::write_loop(transport::ITransport* t, uint64_t gen) {
  while (true) {
    Item item;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return !queue_.empty(); });
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    if (!item) return;                            // shutdown sentinel

    size_t off = 0;
    while (off < item->size()) {
      size_t written = 0;
      const TxResult r = t->send(item->data() + off, item->size() - off, written);
      if (r == TxResult::Error) {
        post_error("write error", gen);
        return;
      }
      if (r == TxResult::Busy) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (!running_.load()) return;
        continue;
      }
      off += written;
    }
    log::debug("sent").kvq("bytes", hex_dump(*item));
  }
}

} // namespace dgtlink

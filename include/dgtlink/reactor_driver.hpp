/**
 * @file reactor_driver.hpp
 * @brief Non-blocking driver: the serial fd lives on the EventLoop.
 *
 * @details
 * - Read interest is registered for the whole session. Each readiness call does
 *   one non-blocking read of at most `FrameDecoder::wanted()` bytes.
 * - Write interest is registered only while the outbound queue is non-empty and
 *   removed the moment it drains. A writer left registered on an idle fd would
 *   spin the loop.
 * - Any read/write error or end of stream stops the session and reports to the
 *   error sink.
 */
#ifndef DGTLINK_REACTOR_DRIVER_HPP
#define DGTLINK_REACTOR_DRIVER_HPP

#include "dgtlink/driver.hpp"

namespace dgtlink {

class ReactorDriver : public IDriver {
public:
  ReactorDriver(EventLoop& loop, FrameSink on_frame, ErrorSink on_error);
  ~ReactorDriver() override;

  bool configure(transport::ITransport& t) override;
  void connect(transport::ITransport& t) override;
  void disconnect() override;
  void write(const std::vector<uint8_t>& bytes) override;
  bool active() const override { return t_ != nullptr; }
  DriverKind kind() const override { return DriverKind::Reactor; }

  size_t queued() const { return out_.size(); }
  bool writer_registered() const { return fd_ >= 0 && loop_.has_writer(fd_); }

private:
  void can_read();
  void can_write();
  void fail(const std::string& reason);

  EventLoop& loop_;
  FrameSink on_frame_;
  ErrorSink on_error_;

  transport::ITransport* t_{nullptr};
  int fd_{-1};
  FrameDecoder decoder_;
  std::vector<uint8_t> rbuf_;
  std::vector<uint8_t> out_;         ///< bytes not yet accepted by the transport
};

} // namespace dgtlink

#endif // DGTLINK_REACTOR_DRIVER_HPP

#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport for DGT boards (header-only, termios).
 *
 * Depends on: unistd.h, fcntl.h, termios.h, sys/ioctl.h.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "dgtlink/transport/transport_base.hpp"
#include <string>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <cerrno>

namespace dgtlink::transport {

class LinuxSerial : public ITransport {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool open(const SerialConfig& cfg, std::string& err) override {
    close();
    path_ = cfg.path;
    if (path_.empty()) { err = "empty device path"; return false; }

    fd_ = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) { err = path_ + ": " + std::strerror(errno); return false; }

    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) { fail(err, "tcgetattr"); return false; }
    ::cfmakeraw(&tio);                              // 8N1, no echo, no line editing

    speed_t sp = B9600;
    switch (cfg.baud) {
      case 9600:   sp = B9600; break;
      case 19200:  sp = B19200; break;
      case 38400:  sp = B38400; break;
      case 57600:  sp = B57600; break;
      case 115200: sp = B115200; break;
      default:     sp = B9600; break;
    }

    ::cfsetispeed(&tio, sp);
    ::cfsetospeed(&tio, sp);
    tio.c_cflag |= CLOCAL | CREAD;                  // enable receiver, ignore modem ctrl
    tio.c_cflag &= ~CSTOPB;                         // one stop bit
    tio.c_cflag &= ~CRTSCTS;                        // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) { fail(err, "tcsetattr"); return false; }
    ::tcflush(fd_, TCIOFLUSH);                      // drop stale bytes from a previous session
    return true;
  }

  void close() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    blocking_ = false;
  }

  bool is_open() const override { return fd_ >= 0; }
  bool supports_readiness() const override { return true; }   // ttys poll fine on Linux
  int fd() const override { return fd_; }

  bool set_blocking(bool blocking) override {
    if (fd_ < 0) return false;
    int flags = ::fcntl(fd_, F_GETFL);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (::fcntl(fd_, F_SETFL, flags) != 0) return false;

    // Blocking reads wait up to one read slice (VTIME is in deciseconds);
    // non-blocking ones return at once.
    termios tio{};
    if (::tcgetattr(fd_, &tio) != 0) return false;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = blocking ? static_cast<cc_t>(BLOCKING_READ_SLICE_MS / 100) : 0;
    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) return false;
    blocking_ = blocking;
    return true;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;
    ssize_t r = ::read(fd_, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0) {
      // Non-blocking: only read when poll said readable, so no data means hangup.
      // Blocking: the read slice elapsed, unless the tty was hung up under us.
      if (!blocking_) return RxResult::Closed;
      termios tio{};
      return ::tcgetattr(fd_, &tio) == 0 ? RxResult::None : RxResult::Closed;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
    return RxResult::Error;
  }

  TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
    written = 0;
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    ssize_t w = ::write(fd_, data, len);
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return TxResult::Busy;
    if (w < 0) return TxResult::Error;
    written = static_cast<std::size_t>(w);
    return TxResult::Ok;
  }

  bool set_exclusive(bool on) override {
    if (fd_ < 0) return false;
    return ::ioctl(fd_, on ? TIOCEXCL : TIOCNXCL) == 0;
  }

  const char* name() const override { return "linux-serial"; }

private:
  void fail(std::string& err, const char* what) {
    err = path_ + ": " + what + ": " + std::strerror(errno);
    close();
  }

  int fd_{-1};
  bool blocking_{false};
  std::string path_;
};

} // namespace dgtlink::transport

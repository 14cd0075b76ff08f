/**
 * @file driver.hpp
 * @brief The I/O strategy seam: how bytes move between the transport and the control loop.
 *
 * @details
 * Two strategies implement the same contract:
 *
 * - **ReactorDriver**: non-blocking fd registered with the EventLoop. Every read,
 *   write, decode and callback happens on the loop thread.
 * - **ThreadedDriver**: blocking fd served by two dedicated threads (read loop,
 *   write loop). Frames and errors are handed back to the loop with
 *   call_soon_threadsafe(); the threads never touch connection state.
 *
 * The choice is made once, when the Connection is built. With DriverKind::Auto
 * `select_driver_kind()` asks the transport: the reactor when its descriptor
 * can be polled, the threaded driver when it cannot. Reactor or Threaded may
 * also be forced by configuration; a reactor refuses (configure() fails on)
 * a transport it cannot poll.
 *
 * @par Contract
 * - `configure(t)` puts the opened transport in the mode the driver needs.
 * - `connect(t)` starts serving @p t. The driver does not own it.
 * - `disconnect()` stops serving, drops partial frames and queued writes. Idempotent.
 * - `write(bytes)` queues bytes for asynchronous sending.
 * - Frame and error sinks are always invoked on the loop thread. After an error
 *   the driver has already stopped reading; the owner is expected to disconnect.
 */
#ifndef DGTLINK_DRIVER_HPP
#define DGTLINK_DRIVER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dgtlink/event_loop.hpp"
#include "dgtlink/frame_decoder.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink {

enum class DriverKind : uint8_t { Reactor = 0, Threaded = 1, Auto = 2 };

const char* to_string(DriverKind k);

/// "reactor", "threaded" or "auto".
bool parse_driver_kind(const std::string& text, DriverKind& out, std::string& err);

/// Resolve Auto against the transport's capabilities; other kinds pass through.
DriverKind select_driver_kind(DriverKind requested, const transport::ITransport& t);

class IDriver {
public:
  using FrameSink = std::function<void(const Frame&)>;
  using ErrorSink = std::function<void(const std::string& reason)>;

  virtual ~IDriver() = default;

  virtual bool configure(transport::ITransport& t) = 0;
  virtual void connect(transport::ITransport& t) = 0;
  virtual void disconnect() = 0;
  virtual void write(const std::vector<uint8_t>& bytes) = 0;
  virtual bool active() const = 0;
  virtual DriverKind kind() const = 0;
};

/// @throws ConfigurationError for DriverKind::Auto (resolve it first).
std::unique_ptr<IDriver> make_driver(DriverKind kind, EventLoop& loop,
                                     IDriver::FrameSink on_frame,
                                     IDriver::ErrorSink on_error);

} // namespace dgtlink

#endif // DGTLINK_DRIVER_HPP

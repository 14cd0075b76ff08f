#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal byte-transport interface the dgtlink drivers run on.
 *
 * The drivers only need a byte pipe: open a named device, switch between
 * blocking and non-blocking reads, move bytes, close. Whether the descriptor
 * can be handed to poll(2) is a property of the transport, and it decides
 * which driver serves it. LinuxSerial is the production implementation;
 * tests plug in a socketpair.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dgtlink::transport {

// Return codes kept simple; errno details go to the log.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Closed=2, Error=3 };

/// Longest a blocking recv() waits before returning RxResult::None.
constexpr int BLOCKING_READ_SLICE_MS = 100;

struct SerialConfig {
  std::string path;        // e.g. /dev/ttyACM0 or /dev/serial/by-id/usb-...
  int baud{9600};          // DGT boards talk 9600 8N1
  bool exclusive{false};   // request TIOCEXCL while open
};

/**
 * @brief Transport trait every driver can rely on.
 *
 * Contract:
 *  - open(cfg, err) acquires the device; false + err on failure.
 *  - set_blocking(b) selects blocking reads (threaded driver) or non-blocking (reactor).
 *    A blocking recv() waits for data but gives up after at most
 *    BLOCKING_READ_SLICE_MS, so a reader thread can notice shutdown.
 *  - recv() pulls up to cap bytes:
 *      Ok (out_len>0), None (nothing ready yet / read slice elapsed),
 *      Closed (end of stream / device gone), Error.
 *  - send() writes what it can; `written` reports how much. Busy when nothing fit.
 *  - set_exclusive() is best effort; false means the ioctl failed.
 *  - supports_readiness() is true when fd() can be watched with poll(2).
 *  - fd() exposes that descriptor, -1 when closed or not pollable.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        open(const SerialConfig& cfg, std::string& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual bool        supports_readiness() const = 0;
  virtual int         fd() const = 0;
  virtual bool        set_blocking(bool blocking) = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual bool        set_exclusive(bool on) = 0;
  virtual const char* name() const = 0;
};

/// Builds a fresh, unopened transport for each connection attempt.
using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace dgtlink::transport

#include "dgtlink/driver.hpp"
#include "dgtlink/reactor_driver.hpp"
#include "dgtlink/status.hpp"
#include "dgtlink/threaded_driver.hpp"

namespace dgtlink {

const char* to_string(DriverKind k) {
  switch (k) {
    case DriverKind::Reactor:  return "reactor";
    case DriverKind::Threaded: return "threaded";
    case DriverKind::Auto:     return "auto";
  }
  return "unknown";
}

bool parse_driver_kind(const std::string& text, DriverKind& out, std::string& err) {
  if      (text == "reactor")  out = DriverKind::Reactor;
  else if (text == "threaded") out = DriverKind::Threaded;
  else if (text == "auto")     out = DriverKind::Auto;
  else {
    err = "unknown driver '" + text + "' (expected reactor, threaded or auto)";
    return false;
  }
  return true;
}

DriverKind select_driver_kind(DriverKind requested, const transport::ITransport& t) {
  if (requested != DriverKind::Auto) return requested;
  return t.supports_readiness() ? DriverKind::Reactor : DriverKind::Threaded;
}

std::unique_ptr<IDriver> make_driver(DriverKind kind, EventLoop& loop,
                                     IDriver::FrameSink on_frame,
                                     IDriver::ErrorSink on_error) {
  switch (kind) {
    case DriverKind::Threaded:
      return std::make_unique<ThreadedDriver>(loop, std::move(on_frame), std::move(on_error));
    case DriverKind::Reactor:
      return std::make_unique<ReactorDriver>(loop, std::move(on_frame), std::move(on_error));
    case DriverKind::Auto:
      break;
  }
  throw ConfigurationError("driver kind 'auto' must be resolved against a transport");
}

} // namespace dgtlink

/**
 * @file log.hpp
 * @brief Line-oriented diagnostics for dgtlink (key=value lines on stderr).
 *
 * @details
 * Logs are meant to be grepped from a terminal or a journal, in the same
 * `status=... reason=...` spirit as the probe tool's output:
 *
 * @code
 *   dgtlink level=info msg="connected" port=/dev/ttyACM0
 *   dgtlink level=warn msg="decode error" kind=bad_ack_sentinel detail="ack0=0x11"
 * @endcode
 *
 * The sink is swappable so tests can capture lines, and calls are serialized
 * because the threaded driver reports errors from its background loops.
 */
#ifndef DGTLINK_LOG_HPP
#define DGTLINK_LOG_HPP

#include <cstdint>
#include <functional>
#include <sstream>
#include <string>

namespace dgtlink {
namespace log {

enum class Level : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using Sink = std::function<void(Level, const std::string& line)>;

/// Minimum level that reaches the sink. Default: Info.
void set_level(Level level);
Level level();

/// Parse "debug", "info", "warn", "error" or "off". Returns false on anything else.
bool parse_level(const std::string& text, Level& out);

const char* to_string(Level level);

/// Replace the output sink. Passing an empty function restores stderr.
void set_sink(Sink sink);

/// Emit one preformatted line if @p lvl passes the threshold.
void write(Level lvl, const std::string& line);

inline bool enabled(Level lvl) { return lvl >= level() && lvl != Level::Off; }

/**
 * @brief Builder for one log line: message first, then `key=value` fields.
 *
 * Flushed to the sink on destruction.
 * @code
 *   log::Line(log::Level::Info, "connected").kv("port", path);
 * @endcode
 */
class Line {
public:
  Line(Level lvl, const std::string& msg);
  ~Line();

  Line(const Line&) = delete;
  Line& operator=(const Line&) = delete;

  template <typename T>
  Line& kv(const char* key, const T& value) {
    if (active_) os_ << ' ' << key << '=' << value;
    return *this;
  }

  /// Quoted variant for free text that may contain spaces.
  Line& kvq(const char* key, const std::string& value);

private:
  Level lvl_;
  bool active_;
  std::ostringstream os_;
};

inline Line debug(const std::string& msg) { return Line(Level::Debug, msg); }
inline Line info (const std::string& msg) { return Line(Level::Info,  msg); }
inline Line warn (const std::string& msg) { return Line(Level::Warn,  msg); }
inline Line error(const std::string& msg) { return Line(Level::Error, msg); }

} // namespace log
} // namespace dgtlink

#endif // DGTLINK_LOG_HPP

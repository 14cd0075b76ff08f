/**
 * @file interpreter.hpp
 * @brief Turns decoded frames into board/clock state and change notifications.
 *
 * @details
 * The interpreter is the only place that knows what a message id means. It
 * owns the live `BoardState`, the last reported `ClockState` and the cached
 * answers to the board's information queries, and tells its listener what
 * happened. It performs no I/O and runs entirely on the control context.
 *
 * @par Message handling
 * | Message            | Effect                                                          |
 * |--------------------|-----------------------------------------------------------------|
 * | board dump         | replace board, reply Board, board event if changed               |
 * | field update       | set one square, board event (always)                            |
 * | version            | "major.minor", reply Version                                    |
 * | serial / long      | payload chars as text, reply SerialNumber / LongSerialNumber    |
 * | battery status     | payload chars minus zero bytes, reply BatteryStatus             |
 * | bw time            | clock ack or running clock update, see below                    |
 * | anything else      | logged at debug level and ignored                               |
 *
 * @par Clock time message
 * The clock shares one message id for two payloads. It is an **ack** when the
 * low nibble of byte 0 or the whole of byte 3 equals 0x0A. Ack fields borrow
 * their top bit from another byte:
 * ```
 *   ack0 = (p[1] & 0x7f) | ((p[3] << 3) & 0x80)    must be 0x10
 *   ack1 = (p[2] & 0x7f) | ((p[3] << 2) & 0x80)    0x88 button, 0x09 version
 *   ack2 = (p[4] & 0x7f) | ((p[0] << 3) & 0x80)    version: major<<4 | minor
 *   ack3 = (p[5] & 0x7f) | ((p[0] << 2) & 0x80)    button: ASCII digit
 * ```
 * This pairing comes from observed device traffic; keep it exactly as is.
 *
 * Otherwise, if any of the first six bytes is non-zero, it is a **running
 * clock** update: bytes 0..2 are the right side (hours nibble, BCD minutes,
 * BCD seconds), bytes 3..5 the left side, and bit 0x10 of byte 6 is the
 * left-lever-down flag. A clock event is raised only when the value changes.
 */
#ifndef DGTLINK_INTERPRETER_HPP
#define DGTLINK_INTERPRETER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "dgtlink/board_state.hpp"
#include "dgtlink/clock_state.hpp"
#include "dgtlink/frame_decoder.hpp"
#include "dgtlink/status.hpp"

namespace dgtlink {

/// Query kinds that have a matching response message.
enum class QueryKind : uint8_t {
  Version          = 0,
  SerialNumber     = 1,
  LongSerialNumber = 2,
  BatteryStatus    = 3,
  Board            = 4,
  ClockVersion     = 5,
  ClockAck         = 6,
  Count            = 7
};

const char* to_string(QueryKind k);

/**
 * @brief Receiver of everything the interpreter decides.
 *
 * Calls happen synchronously inside Interpreter::process(), in wire order.
 */
class InterpreterListener {
public:
  virtual ~InterpreterListener() = default;
  virtual void on_board_changed(const BoardState& board) = 0;
  virtual void on_clock_changed(const ClockState& clock) = 0;
  virtual void on_button_pressed(int button) = 0;
  virtual void on_response(QueryKind kind) = 0;
  virtual void on_decode_error(DecodeError kind, const std::string& detail) = 0;
};

class Interpreter {
public:
  explicit Interpreter(InterpreterListener& listener) : listener_(listener) {}

  /// Dispatch one complete frame.
  void process(const Frame& frame);

  /// Forget everything learned from the current connection.
  void reset();

  const BoardState& board() const { return board_; }
  const std::optional<ClockState>& clock() const { return clock_; }

  const std::string& version() const { return version_; }
  const std::string& serial_number() const { return serial_number_; }
  const std::string& long_serial_number() const { return long_serial_number_; }
  const std::string& battery_status() const { return battery_status_; }
  const std::string& clock_version() const { return clock_version_; }

private:
  void on_board_dump(const Frame& f);
  void on_field_update(const Frame& f);
  void on_version(const Frame& f);
  void on_bwtime(const Frame& f);
  void on_clock_ack(const uint8_t* p);
  void decode_error(DecodeError kind, const std::string& detail);

  InterpreterListener& listener_;

  BoardState board_;
  std::optional<BoardState> last_board_;   ///< last board handed to the listener
  std::optional<ClockState> clock_;        ///< last clock handed to the listener

  std::string version_;
  std::string serial_number_;
  std::string long_serial_number_;
  std::string battery_status_;
  std::string clock_version_;
};

} // namespace dgtlink

#endif // DGTLINK_INTERPRETER_HPP

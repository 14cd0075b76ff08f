/**
 * @file status.hpp
 * @brief Result codes, reply envelopes and error types shared by every dgtlink layer.
 *
 * @details
 * dgtlink never lets transport trouble escape as an exception. Anything that goes
 * wrong on the wire (device unplugged, read error, bad length header) ends in a
 * disconnect, and callers waiting on a query see it as a `Status` in their reply.
 *
 * Exceptions are reserved for caller mistakes that can be reported on the spot:
 * handing the board a malformed position string, or asking the clock to show
 * characters it cannot display. Those throw `ConfigurationError`.
 *
 * @par Error taxonomy
 * | Kind                  | How it surfaces                                   |
 * |-----------------------|---------------------------------------------------|
 * | Transport failure     | disconnect + `Status::ConnectionLost` to waiters  |
 * | Protocol decode error | `DecodeError` to the protocol_error channel + log |
 * | No candidate opened   | `connect_once()` returns `std::nullopt`            |
 * | Bad caller input      | `ConfigurationError` thrown synchronously         |
 */
#ifndef DGTLINK_STATUS_HPP
#define DGTLINK_STATUS_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace dgtlink {

/**
 * @brief Outcome of a suspended query or clock command.
 */
enum class Status : uint8_t {
  Ok             = 0,  ///< Response arrived, value is valid.
  ConnectionLost = 1,  ///< Link dropped while the request was in flight.
  Closed         = 2   ///< Connection was closed explicitly; nothing more will arrive.
};

/// Short lowercase name for logs ("ok", "connection_lost", "closed").
const char* to_string(Status s);

/**
 * @brief Value plus status handed to query completion handlers.
 *
 * `value` is default-constructed unless `status == Status::Ok`.
 */
template <typename T>
struct Reply {
  Status status{Status::Ok};
  T value{};

  bool ok() const { return status == Status::Ok; }
};

template <typename T>
using ReplyHandler = std::function<void(const Reply<T>&)>;

/// Completion handler for commands that produce no value (beep, text).
using DoneHandler = std::function<void(Status)>;

/**
 * @brief Reasons a received frame was discarded by the interpreter.
 *
 * None of these are fatal. The frame is dropped, the condition is reported to
 * the protocol_error channel and logged, and processing carries on.
 */
enum class DecodeError : uint8_t {
  UnknownPiece        = 0,  ///< Piece code outside 0x00..0x0C.
  BadSquare           = 1,  ///< Field update for a square index >= 64.
  ShortPayload        = 2,  ///< Payload shorter than the message layout needs.
  BadAckSentinel      = 3,  ///< Clock ack whose first field is not the sentinel.
  BadButton           = 4,  ///< Button ack whose id is not a printable digit.
  UnknownClockMessage = 5   ///< Time message that is neither an ack nor a clock update.
};

const char* to_string(DecodeError e);

/**
 * @brief Invalid caller-supplied configuration (board notation, clock text, ...).
 *
 * The message always names the offending input so it can be shown as-is.
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what)
  : std::invalid_argument(what) {}
};

} // namespace dgtlink

#endif // DGTLINK_STATUS_HPP

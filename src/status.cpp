#include "dgtlink/status.hpp"

namespace dgtlink {

const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:             return "ok";
    case Status::ConnectionLost: return "connection_lost";
    case Status::Closed:         return "closed";
  }
  return "unknown";
}

const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::UnknownPiece:        return "unknown_piece";
    case DecodeError::BadSquare:           return "bad_square";
    case DecodeError::ShortPayload:        return "short_payload";
    case DecodeError::BadAckSentinel:      return "bad_ack_sentinel";
    case DecodeError::BadButton:           return "bad_button";
    case DecodeError::UnknownClockMessage: return "unknown_clock_message";
  }
  return "unknown";
}

} // namespace dgtlink

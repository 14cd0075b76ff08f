// ============================================================================
// interpreter.cpp: implementation for interpreter.hpp
// Message table and clock ack layout are documented in the header.
// ============================================================================
#include "dgtlink/interpreter.hpp"
#include "dgtlink/commands.hpp"   // hex_dump()
#include "dgtlink/log.hpp"
#include "dgtlink/protocol.hpp"

#include <cstdio>

namespace dgtlink {

namespace {

std::string hex_byte(uint8_t b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02x", b);
  return buf;
}

std::string chars(const std::vector<uint8_t>& payload, bool skip_zero) {
  std::string s;
  s.reserve(payload.size());
  for (uint8_t c : payload) {
    if (skip_zero && c == 0) continue;
    s.push_back(static_cast<char>(c));
  }
  return s;
}

} // namespace

const char* to_string(QueryKind k) {
  switch (k) {
    case QueryKind::Version:          return "version";
    case QueryKind::SerialNumber:     return "serial_number";
    case QueryKind::LongSerialNumber: return "long_serial_number";
    case QueryKind::BatteryStatus:    return "battery_status";
    case QueryKind::Board:            return "board";
    case QueryKind::ClockVersion:     return "clock_version";
    case QueryKind::ClockAck:         return "clock_ack";
    case QueryKind::Count:            break;
  }
  return "unknown";
}

// ---------- public ----------

void Interpreter::process(const Frame& f) {
  if (log::enabled(log::Level::Debug))
    log::debug("frame").kv("id", hex_byte(f.id)).kvq("payload", hex_dump(f.payload));

  switch (f.id) {
    case proto::MSG_BOARD_DUMP:
      on_board_dump(f);
      break;
    case proto::MSG_FIELD_UPDATE:
      on_field_update(f);
      break;
    case proto::MSG_VERSION:
      on_version(f);
      break;
    case proto::MSG_SERIALNR:
      serial_number_ = chars(f.payload, false);
      listener_.on_response(QueryKind::SerialNumber);
      break;
    case proto::MSG_LONG_SERIALNR:
      long_serial_number_ = chars(f.payload, false);
      listener_.on_response(QueryKind::LongSerialNumber);
      break;
    case proto::MSG_BATTERY_STATUS:
      battery_status_ = chars(f.payload, true);
      listener_.on_response(QueryKind::BatteryStatus);
      break;
    case proto::MSG_BWTIME:
      on_bwtime(f);
      break;
    default:
      // EE moves, bus address, trademark, 50-byte dumps: not used here.
      log::debug("ignored message").kv("id", hex_byte(f.id)).kv("len", f.payload.size());
      break;
  }
}

void Interpreter::reset() {
  board_.clear();
  last_board_.reset();
  clock_.reset();
  version_.clear();
  serial_number_.clear();
  long_serial_number_.clear();
  battery_status_.clear();
  clock_version_.clear();
}

// ---------- board ----------

void Interpreter::on_board_dump(const Frame& f) {
  std::string err;
  if (!board_.set_squares(f.payload.data(), f.payload.size(), err)) {
    decode_error(f.payload.size() == BoardState::SQUARES ? DecodeError::UnknownPiece
                                                         : DecodeError::ShortPayload, err);
    return;
  }
  listener_.on_response(QueryKind::Board);

  if (!last_board_ || *last_board_ != board_) {
    last_board_ = board_;
    listener_.on_board_changed(board_);
  }
}

void Interpreter::on_field_update(const Frame& f) {
  if (f.payload.size() < 2) {
    decode_error(DecodeError::ShortPayload, "field update needs 2 bytes");
    return;
  }
  std::string err;
  if (!board_.set_square(f.payload[0], f.payload[1], err)) {
    decode_error(f.payload[0] >= BoardState::SQUARES ? DecodeError::BadSquare
                                                     : DecodeError::UnknownPiece, err);
    return;
  }
  // A single-square update always counts as a change.
  last_board_ = board_;
  listener_.on_board_changed(board_);
}

void Interpreter::on_version(const Frame& f) {
  if (f.payload.size() < 2) {
    decode_error(DecodeError::ShortPayload, "version needs 2 bytes");
    return;
  }
  version_ = std::to_string(f.payload[0]) + "." + std::to_string(f.payload[1]);
  listener_.on_response(QueryKind::Version);
}

// ---------- clock ----------

void Interpreter::on_bwtime(const Frame& f) {
  if (f.payload.size() < proto::CLOCK_PAYLOAD_MIN) {
    decode_error(DecodeError::ShortPayload,
                 "time message has " + std::to_string(f.payload.size()) + " bytes");
    return;
  }
  const uint8_t* p = f.payload.data();

  if ((p[0] & 0x0F) == proto::CLOCK_ACK_MARK || p[3] == proto::CLOCK_ACK_MARK) {
    on_clock_ack(p);
    return;
  }

  bool any = false;
  for (size_t i = 0; i < 6; ++i) any = any || p[i] != 0;
  if (!any) {
    decode_error(DecodeError::UnknownClockMessage, hex_dump(p, proto::CLOCK_PAYLOAD_MIN));
    return;
  }

  ClockState next;
  next.right_seconds   = ClockState::side_seconds(p[0], p[1], p[2]);
  next.left_seconds    = ClockState::side_seconds(p[3], p[4], p[5]);
  next.left_lever_down = (p[6] & proto::CLOCK_LEFT_LEVER_BIT) != 0;

  if (!clock_ || *clock_ != next) {
    clock_ = next;
    listener_.on_clock_changed(next);
  }
}

void Interpreter::on_clock_ack(const uint8_t* p) {
  const uint8_t ack0 = static_cast<uint8_t>((p[1] & 0x7F) | ((p[3] << 3) & 0x80));
  const uint8_t ack1 = static_cast<uint8_t>((p[2] & 0x7F) | ((p[3] << 2) & 0x80));
  const uint8_t ack2 = static_cast<uint8_t>((p[4] & 0x7F) | ((p[0] << 3) & 0x80));
  const uint8_t ack3 = static_cast<uint8_t>((p[5] & 0x7F) | ((p[0] << 2) & 0x80));

  if (ack0 != proto::CLOCK_ACK0_SENTINEL) {
    decode_error(DecodeError::BadAckSentinel, "ack0=" + hex_byte(ack0));
    return;
  }

  if (ack1 == proto::CLOCK_ACK1_BUTTON) {
    if (ack3 < '0' || ack3 > '9') {
      decode_error(DecodeError::BadButton, "ack3=" + hex_byte(ack3));
      return;
    }
    listener_.on_button_pressed(ack3 - '0');
  } else if (ack1 == proto::CLOCK_ACK1_VERSION) {
    clock_version_ = std::to_string(ack2 >> 4) + "." + std::to_string(ack2 & 0x0F);
    listener_.on_response(QueryKind::ClockVersion);
  } else {
    log::debug("clock ack").kv("ack1", hex_byte(ack1)).kv("ack2", hex_byte(ack2));
    listener_.on_response(QueryKind::ClockAck);
  }
}

void Interpreter::decode_error(DecodeError kind, const std::string& detail) {
  log::warn("decode error").kv("kind", to_string(kind)).kvq("detail", detail);
  listener_.on_decode_error(kind, detail);
}

} // namespace dgtlink

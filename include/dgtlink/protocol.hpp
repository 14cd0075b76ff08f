/**
 * @file protocol.hpp
 * @brief Wire constants for the DGT board protocol and its clock sub-protocol.
 *
 * @details
 * @par Inbound framing
 * ```
 *   [id:1][len_hi:1][len_lo:1][payload:len-3]
 *   len = (len_hi << 7) | len_lo      // total length, header included
 * ```
 * Message ids always carry `MESSAGE_BIT`; compare against `msg(...)` values.
 *
 * @par Outbound board commands
 * Single opcode bytes, no framing.
 *
 * @par Outbound clock commands
 * ```
 *   [0x2B][frame_len][0x03][subcommand][args...][0x00]
 * ```
 * The clock answers on the time message (`MSG_BWTIME`) with an ack frame; see
 * interpreter.hpp for how acks and running-clock updates are told apart.
 */
#ifndef DGTLINK_PROTOCOL_HPP
#define DGTLINK_PROTOCOL_HPP

#include <cstddef>
#include <cstdint>

namespace dgtlink {
namespace proto {

// ---- board opcodes (host -> board) ----
constexpr uint8_t SEND_RESET               = 0x40;
constexpr uint8_t SEND_BRD                 = 0x42;
constexpr uint8_t SEND_UPDATE_BRD          = 0x44;
constexpr uint8_t RETURN_SERIALNR          = 0x45;
constexpr uint8_t SEND_UPDATE_NICE         = 0x4B;
constexpr uint8_t SEND_BATTERY_STATUS      = 0x4C;
constexpr uint8_t SEND_VERSION             = 0x4D;
constexpr uint8_t RETURN_LONG_SERIALNR     = 0x55;

// ---- message ids (board -> host), without the message bit ----
constexpr uint8_t MESSAGE_BIT              = 0x80;

constexpr uint8_t DGT_NONE                 = 0x00;
constexpr uint8_t DGT_BOARD_DUMP           = 0x06;
constexpr uint8_t DGT_BWTIME               = 0x0D;
constexpr uint8_t DGT_FIELD_UPDATE         = 0x0E;
constexpr uint8_t DGT_EE_MOVES             = 0x0F;
constexpr uint8_t DGT_BUSADRES             = 0x10;
constexpr uint8_t DGT_SERIALNR             = 0x11;
constexpr uint8_t DGT_TRADEMARK            = 0x12;
constexpr uint8_t DGT_VERSION              = 0x13;
constexpr uint8_t DGT_BOARD_DUMP_50B       = 0x14;
constexpr uint8_t DGT_BOARD_DUMP_50W       = 0x15;
constexpr uint8_t DGT_BATTERY_STATUS       = 0x20;
constexpr uint8_t DGT_LONG_SERIALNR        = 0x22;

constexpr uint8_t msg(uint8_t id) { return static_cast<uint8_t>(MESSAGE_BIT | id); }

constexpr uint8_t MSG_BOARD_DUMP           = msg(DGT_BOARD_DUMP);
constexpr uint8_t MSG_BWTIME               = msg(DGT_BWTIME);
constexpr uint8_t MSG_FIELD_UPDATE         = msg(DGT_FIELD_UPDATE);
constexpr uint8_t MSG_EE_MOVES             = msg(DGT_EE_MOVES);
constexpr uint8_t MSG_BUSADRES             = msg(DGT_BUSADRES);
constexpr uint8_t MSG_SERIALNR             = msg(DGT_SERIALNR);
constexpr uint8_t MSG_TRADEMARK            = msg(DGT_TRADEMARK);
constexpr uint8_t MSG_VERSION              = msg(DGT_VERSION);
constexpr uint8_t MSG_BOARD_DUMP_50B       = msg(DGT_BOARD_DUMP_50B);
constexpr uint8_t MSG_BOARD_DUMP_50W       = msg(DGT_BOARD_DUMP_50W);
constexpr uint8_t MSG_BATTERY_STATUS       = msg(DGT_BATTERY_STATUS);
constexpr uint8_t MSG_LONG_SERIALNR        = msg(DGT_LONG_SERIALNR);

// ---- framing ----
constexpr size_t  HEADER_SIZE              = 3;

// ---- clock sub-protocol ----
constexpr uint8_t CLOCK_MESSAGE            = 0x2B;
constexpr uint8_t CLOCK_START_MESSAGE      = 0x03;
constexpr uint8_t CLOCK_END_MESSAGE        = 0x00;
constexpr uint8_t CLOCK_DISPLAY            = 0x01;
constexpr uint8_t CLOCK_SEND_VERSION       = 0x09;
constexpr uint8_t CLOCK_BEEP               = 0x0B;
constexpr uint8_t CLOCK_ASCII              = 0x0C;

// Ack decoding: sentinel in the low nibble of byte 0 / in byte 3 marks an ack.
constexpr uint8_t CLOCK_ACK_MARK           = 0x0A;
constexpr uint8_t CLOCK_ACK0_SENTINEL      = 0x10;
constexpr uint8_t CLOCK_ACK1_BUTTON        = 0x88;
constexpr uint8_t CLOCK_ACK1_VERSION       = 0x09;
constexpr uint8_t CLOCK_LEFT_LEVER_BIT     = 0x10;

// Time payload: 3 bytes right side, 3 bytes left side, 1 status byte.
constexpr size_t  CLOCK_PAYLOAD_MIN        = 7;

// Beep: one device interval is 64 ms, 10 s at most.
constexpr unsigned CLOCK_BEEP_INTERVAL_MS  = 64;
constexpr unsigned CLOCK_BEEP_MAX_MS       = 10000;

// Display widths.
constexpr size_t  CLOCK_XL_WIDTH           = 6;   ///< DGT XL: 6 segment digits
constexpr size_t  CLOCK_3000_WIDTH         = 8;   ///< DGT 3000: 8 ASCII cells

// Wire settings.
constexpr int     DEFAULT_BAUD             = 9600;

} // namespace proto
} // namespace dgtlink

#endif // DGTLINK_PROTOCOL_HPP

/**
 * @file commands.hpp
 * @brief Builders for every byte sequence dgtlink sends to the board or its clock.
 *
 * @details
 * Keeping the encoders here means the connection logic never hand-assembles
 * bytes, and the exact layouts can be checked by unit tests without a device.
 *
 * @par Board commands
 * One opcode byte each (`make_board_command(proto::SEND_BRD)` and friends).
 *
 * @par Clock commands
 * | Builder                       | Bytes                                                    |
 * |-------------------------------|----------------------------------------------------------|
 * | make_clock_version_request()  | 2B 03 03 09 00                                           |
 * | make_clock_beep(n)            | 2B 04 03 0B n 00                                         |
 * | make_clock_ascii(t)           | 2B 0C 03 0C t0..t7 01 00                                 |
 * | make_clock_display(t)         | 2B 0B 03 01 t2 t1 t0 t5 t4 t3 00 01 00                   |
 *
 * The DGT XL display is wired in two groups of three digits, each group
 * addressed right to left, hence the `[2,1,0,5,4,3]` order.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "etl/string.h"
#include "dgtlink/protocol.hpp"

namespace dgtlink {

/// Text already padded to a clock display width (6 or 8 cells).
using ClockText = etl::string<proto::CLOCK_3000_WIDTH>;

/// One opcode byte; any of the `proto::SEND_*` / `RETURN_*` constants.
std::vector<uint8_t> make_board_command(uint8_t opcode);

std::vector<uint8_t> make_clock_version_request();

/// @param intervals number of 64 ms beep intervals, see beep_intervals().
std::vector<uint8_t> make_clock_beep(uint8_t intervals);

/// DGT 3000 text frame. @p text must be exactly 8 characters (see center_text()).
std::vector<uint8_t> make_clock_ascii(const ClockText& text);

/// DGT XL text frame. @p text must be exactly 6 characters (see center_text()).
std::vector<uint8_t> make_clock_display(const ClockText& text);

/**
 * @brief Convert a beep duration to device intervals.
 *
 * Clamped to 10 s, rounded to the nearest 64 ms interval, never below 1.
 */
uint8_t beep_intervals(std::chrono::milliseconds duration);

/**
 * @brief Center @p text in a display of @p width cells.
 *
 * Odd padding puts the extra space on the left. Text wider than the display
 * is cut to @p width and a warning is logged.
 *
 * @return false (with @p err set) if @p text contains non-ASCII bytes.
 */
bool center_text(const std::string& text, size_t width, ClockText& out, std::string& err);

/// "2b 04 03 0b 01 00" style dump for debug logs.
std::string hex_dump(const uint8_t* data, size_t n);
inline std::string hex_dump(const std::vector<uint8_t>& v) { return hex_dump(v.data(), v.size()); }

} // namespace dgtlink

/**
 * @file clock_state.hpp
 * @brief Snapshot of the clock attached to the board: both remaining times and the lever.
 *
 * @details
 * The clock reports each side as packed BCD: hours in the low nibble of one
 * byte, then minutes and seconds as two decimal digits per byte. The
 * interpreter converts that to whole seconds and builds a `ClockState`.
 *
 * Snapshots are compared by value so repeated identical reports (the clock
 * sends one per second even when paused) do not produce repeated events.
 */
#ifndef DGTLINK_CLOCK_STATE_HPP
#define DGTLINK_CLOCK_STATE_HPP

#include <cstdint>
#include <string>

namespace dgtlink {

struct ClockState {
  uint32_t left_seconds{0};     ///< Remaining time on the left display.
  uint32_t right_seconds{0};    ///< Remaining time on the right display.
  bool left_lever_down{false};  ///< Lever position: true when the left side is pressed down.

  bool operator==(const ClockState& o) const {
    return left_seconds == o.left_seconds
        && right_seconds == o.right_seconds
        && left_lever_down == o.left_lever_down;
  }
  bool operator!=(const ClockState& o) const { return !(*this == o); }

  /// "h:mm:ss h:mm:ss left-down|left-up" (left time first).
  std::string to_string() const;

  /// Two BCD digits in one byte to their value, e.g. 0x59 -> 59.
  static uint32_t from_bcd(uint8_t b) { return (b >> 4) * 10u + (b & 0x0Fu); }

  /// Hours nibble + BCD minutes + BCD seconds to total seconds.
  static uint32_t side_seconds(uint8_t hours_byte, uint8_t mins_bcd, uint8_t secs_bcd) {
    return (hours_byte & 0x0Fu) * 3600u + from_bcd(mins_bcd) * 60u + from_bcd(secs_bcd);
  }

  /// Seconds as "h:mm:ss".
  static std::string format_hms(uint32_t seconds);
};

} // namespace dgtlink

#endif // DGTLINK_CLOCK_STATE_HPP

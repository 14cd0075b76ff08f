#include "dgtlink/clock_state.hpp"

#include <cstdio>

namespace dgtlink {

std::string ClockState::format_hms(uint32_t seconds) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%u:%02u:%02u",
                seconds / 3600u, (seconds / 60u) % 60u, seconds % 60u);
  return buf;
}

std::string ClockState::to_string() const {
  return format_hms(left_seconds) + " " + format_hms(right_seconds)
       + (left_lever_down ? " left-down" : " left-up");
}

} // namespace dgtlink

/**
 * @file ports.hpp
 * @brief Turn port patterns into an ordered list of device paths to try.
 *
 * @details
 * Users configure patterns such as `/dev/ttyACM*` or a fixed
 * `/dev/serial/by-id/usb-Digital_Game_Technology_...` path. The connection
 * tries the resulting candidates in order and keeps the first one that opens.
 *
 * STRATEGY
 * --------
 * 1. Each pattern is expanded with glob(3), in the order given. A pattern that
 *    matches nothing is kept verbatim, so a device that is not plugged in yet
 *    (or a non-filesystem address) is still attempted.
 * 2. Every `/dev/serial/by-id` entry whose canonical device path matches one
 *    of the patterns (fnmatch) is appended. This catches boards reachable only
 *    through the stable by-id links.
 * 3. Duplicates are dropped; first occurrence wins.
 *
 * Nothing here opens a device. Probing happens in Connection::connect_once().
 */
#ifndef DGTLINK_PORTS_HPP
#define DGTLINK_PORTS_HPP

#include <string>
#include <vector>

namespace dgtlink {

/// Default patterns for USB-attached boards on Linux.
std::vector<std::string> default_port_globs();

/// Expand @p globs into unique candidate addresses, see file comment for order.
std::vector<std::string> port_candidates(const std::vector<std::string>& globs);

/**
 * @brief Serial devices visible right now (by-id links resolved, then ttyACM/ttyUSB).
 *
 * Used by the tools to suggest something when no port was given.
 */
std::vector<std::string> list_serial_devices();

} // namespace dgtlink

#endif // DGTLINK_PORTS_HPP

/**
 * @file config.hpp
 * @brief Settings shared by the dgtlink tools, read from a small JSON file.
 *
 * @details
 * Location: `$XDG_CONFIG_HOME/dgtlink/config.json`, falling back to
 * `~/.config/dgtlink/config.json`. Every key is optional:
 *
 * @code
 * {
 *   "ports":           ["/dev/ttyACM*", "/dev/serial/by-id/usb-Digital_Game_Technology*"],
 *   "lock_port":       true,
 *   "baud":            9600,
 *   "initial_backoff": 0.5,
 *   "max_backoff":     10,
 *   "driver":          "auto",
 *   "log_level":       "info"
 * }
 * @endcode
 *
 * Backoff values are seconds. Unknown keys are ignored so newer files keep
 * working with older tools. Command-line flags override whatever is loaded.
 */
#ifndef DGTLINK_CONFIG_HPP
#define DGTLINK_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>

#include "dgtlink/driver.hpp"
#include "dgtlink/log.hpp"
#include "dgtlink/protocol.hpp"

namespace dgtlink {

struct Config {
  std::vector<std::string>  port_globs;          ///< empty → default_port_globs()
  bool                      lock_port{false};
  unsigned                  baud{proto::DEFAULT_BAUD};
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{10000};
  DriverKind                driver{DriverKind::Auto};
  log::Level                log_level{log::Level::Info};
};

/// `$XDG_CONFIG_HOME/dgtlink/config.json` or `$HOME/.config/dgtlink/config.json`.
std::string default_config_path();

/**
 * @brief Overlay the keys found in @p path onto @p cfg.
 * @return false with @p err set on unreadable JSON or a key of the wrong type.
 *         A missing file is not an error; @p cfg is left untouched.
 */
bool load_config(const std::string& path, Config& cfg, std::string& err);

/// Same as load_config() for an in-memory document.
bool parse_config(const std::string& text, Config& cfg, std::string& err);

} // namespace dgtlink

#endif // DGTLINK_CONFIG_HPP

// ============================================================================
// config.cpp: JSON settings file for the dgtlink tools
// ============================================================================
#include "dgtlink/config.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace dgtlink {

// ---------- helpers ----------

static bool seconds_field(const json& j, const char* key,
                          std::chrono::milliseconds& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number()) {
    err = std::string("config: '") + key + "' must be a number of seconds";
    return false;
  }
  const double s = v.get<double>();
  if (s < 0.0) {
    err = std::string("config: '") + key + "' must not be negative";
    return false;
  }
  out = std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
  return true;
}

// Apply one document. Work on a copy so a failure leaves cfg as it was.
static bool apply(const json& j, Config& cfg, std::string& err) {
  if (!j.is_object()) { err = "config: top level must be an object"; return false; }

  Config next = cfg;

  if (j.contains("ports")) {
    const json& v = j.at("ports");
    if (v.is_string()) {
      next.port_globs = {v.get<std::string>()};
    } else if (v.is_array()) {
      next.port_globs.clear();
      for (const auto& e : v) {
        if (!e.is_string()) { err = "config: 'ports' entries must be strings"; return false; }
        next.port_globs.push_back(e.get<std::string>());
      }
    } else {
      err = "config: 'ports' must be a string or an array of strings";
      return false;
    }
  }

  if (j.contains("lock_port")) {
    if (!j.at("lock_port").is_boolean()) { err = "config: 'lock_port' must be true or false"; return false; }
    next.lock_port = j.at("lock_port").get<bool>();
  }

  if (j.contains("baud")) {
    const json& v = j.at("baud");
    if (!v.is_number_unsigned() || v.get<unsigned>() == 0) {
      err = "config: 'baud' must be a positive integer";
      return false;
    }
    next.baud = v.get<unsigned>();
  }

  if (!seconds_field(j, "initial_backoff", next.initial_backoff, err)) return false;
  if (!seconds_field(j, "max_backoff", next.max_backoff, err)) return false;
  if (next.initial_backoff.count() == 0) {
    err = "config: 'initial_backoff' must be greater than zero";
    return false;
  }
  if (next.max_backoff < next.initial_backoff) {
    err = "config: 'max_backoff' is smaller than 'initial_backoff'";
    return false;
  }

  if (j.contains("driver")) {
    if (!j.at("driver").is_string()) { err = "config: 'driver' must be a string"; return false; }
    std::string why;
    if (!parse_driver_kind(j.at("driver").get<std::string>(), next.driver, why)) {
      err = "config: " + why;
      return false;
    }
  }

  if (j.contains("log_level")) {
    const json& v = j.at("log_level");
    if (!v.is_string() || !log::parse_level(v.get<std::string>(), next.log_level)) {
      err = "config: 'log_level' must be one of debug|info|warn|error|off";
      return false;
    }
  }

  cfg = std::move(next);
  return true;
}

// ---------- public ----------

std::string default_config_path() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return (base / "dgtlink" / "config.json").string();
}

bool parse_config(const std::string& text, Config& cfg, std::string& err) {
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) { err = "config: not valid JSON"; return false; }
  return apply(j, cfg, err);
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;

  std::ifstream in(path);
  if (!in) { err = "config: cannot read " + path; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (!parse_config(ss.str(), cfg, err)) {
    err += " (" + path + ")";
    return false;
  }
  return true;
}

} // namespace dgtlink

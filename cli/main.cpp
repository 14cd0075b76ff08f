/**
 * @file main.cpp
 * @brief dgtlink-monitor: watch a DGT board and print what happens on it.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and merge them over the JSON settings file
 *    (~/.config/dgtlink/config.json, see config.hpp).
 *  - Keep a board connected through unplug/replug (auto_connect with backoff).
 *  - Print connect/disconnect, position, clock and button events, either as
 *    readable text or as one JSON object per line (--format json).
 *  - Optionally, after each connect: query board information (--info),
 *    beep (--beep <ms>) and show text on the clock (--text / --text-3000).
 *
 * Notes:
 *  - Ctrl-C closes the connection cleanly before exiting.
 *  - Diagnostics go to stderr via dgtlink::log, events to stdout.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "dgtlink/config.hpp"
#include "dgtlink/connection.hpp"
#include "dgtlink/event_loop.hpp"
#include "dgtlink/log.hpp"
#include "dgtlink/ports.hpp"
#include "dgtlink/reconnect.hpp"

using json = nlohmann::json;
using namespace dgtlink;

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop.store(true); }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

// One printer for both formats so every event reads the same way.
struct Printer {
  bool as_json{false};
  Ansi ansi;

  void event(const json& j, const std::string& pretty) const {
    if (as_json) std::cout << j.dump() << "\n";
    else         std::cout << pretty << "\n";
    std::cout.flush();
  }
};

static json board_json(const BoardState& b) {
  json squares = json::array();
  for (size_t i = 0; i < BoardState::SQUARES; ++i) squares.push_back(b.at(i));
  return json{{"event", "board"}, {"fen", std::string(b.fen().c_str())}, {"squares", squares}};
}

static json clock_json(const ClockState& c) {
  return json{{"event", "clock"},
              {"left", c.left_seconds},
              {"right", c.right_seconds},
              {"left_lever_down", c.left_lever_down}};
}

// ---------- per-connection actions ----------

struct Actions {
  bool info{false};
  int beep_ms{0};
  std::optional<std::string> text;
  std::optional<std::string> text_3000;
};

static void query_info(Connection& conn, const Printer& out) {
  auto show = [&out](const char* key) {
    return [&out, key](const Reply<std::string>& r) {
      json j{{"event", "info"}, {"key", key}, {"status", to_string(r.status)}};
      if (r.ok()) j["value"] = r.value;
      out.event(j, out.ansi.dim(std::string(key) + ": ") +
                       (r.ok() ? r.value : out.ansi.red(to_string(r.status))));
    };
  };
  conn.get_version(show("version"));
  conn.get_serial_number(show("serial"));
  conn.get_long_serial_number(show("long_serial"));
  conn.get_battery_status(show("battery"));
  conn.get_clock_version(show("clock_version"));
}

static void run_actions(Connection& conn, const Actions& act, const Printer& out) {
  if (act.info) query_info(conn, out);

  if (act.text) {
    try {
      conn.clock_text(*act.text, act.text_3000, [&out](Status st) {
        out.event(json{{"event", "clock_text"}, {"status", to_string(st)}},
                  out.ansi.dim("clock text: ") + to_string(st));
      });
    } catch (const ConfigurationError& e) {
      log::error("clock text rejected").kvq("reason", e.what());
    }
  }

  if (act.beep_ms > 0) {
    conn.clock_beep(std::chrono::milliseconds(act.beep_ms), [&out](Status st) {
      out.event(json{{"event", "clock_beep"}, {"status", to_string(st)}},
                out.ansi.dim("clock beep: ") + to_string(st));
    });
  }
}

int main(int argc, char** argv) {
  // CLI-centered options
  std::vector<std::string> opt_ports;
  std::string opt_config;
  std::string opt_driver;
  std::string opt_log_level;
  std::string opt_format = "pretty"; // pretty|json
  double opt_max_backoff = 0.0;      // 0 => config / default
  bool opt_lock = false;
  bool opt_no_color = false;
  bool opt_list = false;

  Actions act;
  std::string opt_text, opt_text_3000;

  CLI::App app{"dgtlink-monitor: follow a DGT board"};

  app.add_option("--port", opt_ports, "Device path or glob (repeatable)");
  app.add_option("--config", opt_config, "Settings file (default: XDG config)");
  app.add_option("--driver", opt_driver, "I/O driver: reactor|threaded|auto")
     ->check(CLI::IsMember({"reactor", "threaded", "auto"}));
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--max-backoff", opt_max_backoff, "Longest wait between reconnects (s)")->check(CLI::PositiveNumber);
  app.add_flag("--lock", opt_lock, "Request exclusive access to the port");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--list", opt_list, "List serial devices and exit");

  app.add_flag("--info", act.info, "Query version, serial numbers and battery on connect");
  app.add_option("--beep", act.beep_ms, "Beep on connect for this many ms")->check(CLI::Range(0, 10000));
  app.add_option("--text", opt_text, "Show text on the clock (DGT XL, 6 chars)");
  app.add_option("--text-3000", opt_text_3000, "Longer text for the DGT 3000 (8 chars)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  if (opt_list) {
    for (const auto& dev : list_serial_devices()) std::cout << dev << "\n";
    return 0;
  }

  // Settings: file first, flags win.
  Config cfg;
  std::string err;
  if (!load_config(opt_config.empty() ? default_config_path() : opt_config, cfg, err)) {
    std::cerr << "error: " << err << "\n";
    return 2;
  }
  if (!opt_ports.empty()) cfg.port_globs = opt_ports;
  if (cfg.port_globs.empty()) cfg.port_globs = default_port_globs();
  if (opt_lock) cfg.lock_port = true;
  if (opt_max_backoff > 0.0)
    cfg.max_backoff = std::chrono::milliseconds(static_cast<long long>(opt_max_backoff * 1000.0));
  if (cfg.max_backoff < cfg.initial_backoff) cfg.max_backoff = cfg.initial_backoff;
  if (!opt_driver.empty() && !parse_driver_kind(opt_driver, cfg.driver, err)) {
    std::cerr << "error: " << err << "\n";
    return 2;
  }
  if (!opt_log_level.empty() && !log::parse_level(opt_log_level, cfg.log_level)) {
    std::cerr << "error: unknown log level '" << opt_log_level << "'\n";
    return 2;
  }
  log::set_level(cfg.log_level);

  if (!opt_text.empty()) act.text = opt_text;
  if (!opt_text_3000.empty()) act.text_3000 = opt_text_3000;

  Printer out;
  out.as_json = opt_format == "json";
  out.ansi.enabled = !opt_no_color && is_tty_stdout() && !out.as_json;

  // Connection + reconnect supervisor
  EventLoop loop;
  ConnectionOptions copts;
  copts.port_globs = cfg.port_globs;
  copts.lock_port  = cfg.lock_port;
  copts.baud       = cfg.baud;
  copts.driver     = cfg.driver;

  ReconnectOptions ropts;
  ropts.initial_backoff = cfg.initial_backoff;
  ropts.max_backoff     = cfg.max_backoff;

  AutoConnection dgt = auto_connect(loop, copts, ropts);
  Connection& conn = *dgt.connection;
  EventHub& ev = conn.events();

  ev.on_connected([&](const std::string& port) {
    out.event(json{{"event", "connected"}, {"port", port}},
              out.ansi.bold("Board connected to " + port));
    run_actions(conn, act, out);
  });
  ev.on_disconnected([&] {
    out.event(json{{"event", "disconnected"}}, out.ansi.red("Board disconnected"));
  });
  ev.on_board([&](const BoardState& b) {
    out.event(board_json(b), out.ansi.bold("Position: ") + b.fen().c_str() + "\n" + b.to_string());
  });
  ev.on_clock([&](const ClockState& c) {
    out.event(clock_json(c), out.ansi.dim("Clock: ") + c.to_string());
  });
  ev.on_button_pressed([&](int button) {
    out.event(json{{"event", "button_pressed"}, {"button", button}},
              "Button " + std::to_string(button) + " pressed");
  });
  ev.on_protocol_error([&](DecodeError e, const std::string& detail) {
    out.event(json{{"event", "protocol_error"}, {"kind", to_string(e)}, {"detail", detail}},
              out.ansi.red(std::string("Protocol error: ") + to_string(e) + " " + detail));
  });

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  log::info("waiting for board").kv("driver", to_string(conn.driver_kind()));
  while (!g_stop.load()) loop.run_once(std::chrono::milliseconds(200));

  conn.close();
  loop.run_once(std::chrono::milliseconds(0));   // deliver the Closed completions
  return 0;
}

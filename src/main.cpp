// ============================================================================
// dgtlink-probe: one-shot board check
//
// Connects to the first board found, asks for version, serial numbers,
// battery status and position, prints key=value lines and exits.
//
// Exit codes: 0 ok, 1 open failed / link lost, 2 usage, 3 timeout.
// ============================================================================
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI.hpp"

#include "dgtlink/config.hpp"
#include "dgtlink/connection.hpp"
#include "dgtlink/event_loop.hpp"
#include "dgtlink/log.hpp"
#include "dgtlink/ports.hpp"

using namespace dgtlink;

namespace {

struct Answers {
  int pending{5};
  Status worst{Status::Ok};
  std::string version, serial, long_serial, battery;
  BoardState board;

  void settle(Status st) {
    if (st != Status::Ok && worst == Status::Ok) worst = st;
    --pending;
  }
};

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"dgtlink-probe: query a DGT board once"};

  std::vector<std::string> ports;      // --port <glob>, repeatable
  std::string config_path;             // --config <file>
  std::string driver_name;             // --driver reactor|threaded|auto
  std::string log_level;               // --log-level
  int timeout_ms = 3000;
  bool do_scan = false;
  bool lock = false;

  app.add_option("--port", ports, "Device path or glob (repeatable)");
  app.add_option("--config", config_path, "Settings file (default: XDG config)");
  app.add_option("--driver", driver_name, "I/O driver: reactor|threaded|auto")
     ->check(CLI::IsMember({"reactor", "threaded", "auto"}));
  app.add_option("--log-level", log_level, "debug|info|warn|error|off");
  app.add_option("--timeout", timeout_ms, "Give up after this many ms")->check(CLI::PositiveNumber);
  app.add_flag("--scan", do_scan, "List candidate devices and exit");
  app.add_flag("--lock", lock, "Request exclusive access to the port");

  CLI11_PARSE(app, argc, argv);

  // -------- settings: file first, flags win --------
  Config cfg;
  std::string err;
  if (!load_config(config_path.empty() ? default_config_path() : config_path, cfg, err)) {
    std::cerr << "status=error reason=bad_config detail=\"" << err << "\"\n";
    return 2;
  }
  if (!ports.empty()) cfg.port_globs = ports;
  if (cfg.port_globs.empty()) cfg.port_globs = default_port_globs();
  if (lock) cfg.lock_port = true;
  if (!driver_name.empty() && !parse_driver_kind(driver_name, cfg.driver, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 2;
  }
  if (!log_level.empty() && !log::parse_level(log_level, cfg.log_level)) {
    std::cerr << "status=error reason=bad_log_level value=" << log_level << "\n";
    return 2;
  }
  log::set_level(cfg.log_level);

  // -------- scan mode --------
  if (do_scan) {
    for (const auto& dev : port_candidates(cfg.port_globs)) std::cout << "dev=" << dev << "\n";
    return 0;
  }

  // -------- connect --------
  EventLoop loop;
  ConnectionOptions opts;
  opts.port_globs = cfg.port_globs;
  opts.lock_port  = cfg.lock_port;
  opts.baud       = cfg.baud;
  opts.driver     = cfg.driver;
  Connection conn(loop, opts);

  const auto port = conn.connect_once();
  if (!port) {
    std::cerr << "status=error reason=open_failed";
    for (const auto& g : cfg.port_globs) std::cerr << " port=" << g;
    std::cerr << "\n";
    const auto seen = list_serial_devices();
    for (const auto& dev : seen) std::cerr << "candidate dev=" << dev << "\n";
    return 1;
  }

  // -------- queries (distinct kinds, so they can run side by side) --------
  Answers a;
  conn.get_version([&a](const Reply<std::string>& r) { a.version = r.value; a.settle(r.status); });
  conn.get_serial_number([&a](const Reply<std::string>& r) { a.serial = r.value; a.settle(r.status); });
  conn.get_long_serial_number([&a](const Reply<std::string>& r) { a.long_serial = r.value; a.settle(r.status); });
  conn.get_battery_status([&a](const Reply<std::string>& r) { a.battery = r.value; a.settle(r.status); });
  conn.get_board([&a](const Reply<BoardState>& r) { a.board = r.value; a.settle(r.status); });

  const bool done = loop.run_until([&a] { return a.pending == 0; },
                                   std::chrono::milliseconds(timeout_ms));
  if (!done) {
    conn.close();
    std::cerr << "status=error reason=timeout port=" << *port << "\n";
    return 3;
  }
  if (a.worst != Status::Ok) {
    conn.close();
    std::cerr << "status=error reason=" << to_string(a.worst) << " port=" << *port << "\n";
    return 1;
  }

  std::cout << "status=ok port=" << *port << " driver=" << to_string(conn.driver_kind()) << "\n"
            << "version=" << a.version << "\n"
            << "serial=" << a.serial << "\n"
            << "long_serial=" << a.long_serial << "\n"
            << "battery=" << a.battery << "\n"
            << "fen=" << a.board.fen().c_str() << "\n";
  conn.close();
  return 0;
}

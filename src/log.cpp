// ============================================================================
// log.cpp: implementation for log.hpp
// ============================================================================
#include "dgtlink/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace dgtlink {
namespace log {

namespace {
std::atomic<Level> g_level{Level::Info};
std::mutex g_mu;          // guards g_sink and the write itself
Sink g_sink;              // empty => stderr
}

void set_level(Level lvl) { g_level.store(lvl); }

Level level() { return g_level.load(); }

bool parse_level(const std::string& text, Level& out) {
  if      (text == "debug") out = Level::Debug;
  else if (text == "info")  out = Level::Info;
  else if (text == "warn")  out = Level::Warn;
  else if (text == "error") out = Level::Error;
  else if (text == "off")   out = Level::Off;
  else return false;
  return true;
}

const char* to_string(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "?";
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_sink = std::move(sink);
}

void write(Level lvl, const std::string& line) {
  if (!enabled(lvl)) return;
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_sink) {
    g_sink(lvl, line);
  } else {
    std::cerr << line << "\n";
  }
}

// ---------- Line ----------

Line::Line(Level lvl, const std::string& msg)
: lvl_(lvl), active_(enabled(lvl)) {
  if (active_) os_ << "dgtlink level=" << to_string(lvl) << " msg=\"" << msg << '"';
}

Line::~Line() {
  if (active_) write(lvl_, os_.str());
}

Line& Line::kvq(const char* key, const std::string& value) {
  if (active_) os_ << ' ' << key << "=\"" << value << '"';
  return *this;
}

} // namespace log
} // namespace dgtlink

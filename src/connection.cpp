// ============================================================================
// connection.cpp: implementation for connection.hpp
// ============================================================================
#include "dgtlink/connection.hpp"
#include "dgtlink/log.hpp"
#include "dgtlink/ports.hpp"
#include "dgtlink/transport/transport_linux_serial.hpp"

#include <utility>

namespace dgtlink {

const char* to_string(Connection::State s) {
  switch (s) {
    case Connection::State::Disconnected: return "disconnected";
    case Connection::State::Connecting:   return "connecting";
    case Connection::State::Connected:    return "connected";
    case Connection::State::Closed:       return "closed";
  }
  return "unknown";
}

Connection::Connection(EventLoop& loop, ConnectionOptions opts)
: loop_(loop),
  opts_(std::move(opts)),
  interp_(*this),
  connected_(loop),
  clock_lock_(loop),
  alive_(std::make_shared<bool>(true)) {
  for (auto& s : signals_) s = std::make_unique<PendingSignal>(loop_);
  // Every transport from the factory is the same type, so one unopened
  // instance answers the capability question for the whole lifetime.
  const DriverKind kind = select_driver_kind(opts_.driver, *make_transport());
  driver_ = make_driver(kind, loop_,
                        [this](const Frame& f) { on_frame(f); },
                        [this](const std::string& reason) { on_driver_error(reason); });
}

Connection::~Connection() {
  alive_.reset();
  if (beep_timer_) loop_.cancel(*beep_timer_);
  // Stop the driver before the transport it serves goes away.
  driver_->disconnect();
  if (transport_) transport_->close();
}

DoneHandler Connection::guard(DoneHandler fn) const {
  std::weak_ptr<bool> alive = alive_;
  return [alive, fn](Status st) {
    if (alive.lock()) fn(st);
  };
}

std::unique_ptr<transport::ITransport> Connection::make_transport() const {
  if (opts_.transport) return opts_.transport();
  return std::make_unique<transport::LinuxSerial>();
}

// ---------- link ----------

std::optional<std::string> Connection::connect_once() {
  const auto& globs = opts_.port_globs.empty() ? default_port_globs() : opts_.port_globs;
  return connect_once(port_candidates(globs));
}

std::optional<std::string> Connection::connect_once(const std::vector<std::string>& candidates) {
  if (state_ == State::Closed) {
    log::warn("connect on closed connection");
    return std::nullopt;
  }
  if (state_ == State::Connected) return address_;

  state_ = State::Connecting;
  for (const auto& addr : candidates) {
    transport::SerialConfig cfg;
    cfg.path = addr;
    cfg.baud = opts_.baud;

    auto t = make_transport();
    std::string err;
    if (!t->open(cfg, err)) {
      log::debug("open failed").kv("port", addr).kvq("reason", err);
      continue;
    }
    // Close once and reopen to recover from an interrupted session.
    t->close();
    if (!t->open(cfg, err)) {
      log::debug("reopen failed").kv("port", addr).kvq("reason", err);
      continue;
    }
    if (opts_.lock_port && !t->set_exclusive(true))
      log::warn("could not lock port").kv("port", addr);

    if (!driver_->configure(*t)) {
      log::warn("could not configure port").kv("port", addr).kv("driver", to_string(driver_->kind()));
      t->close();
      continue;
    }

    transport_ = std::move(t);
    address_ = addr;
    ++session_;
    state_ = State::Connected;
    driver_->connect(*transport_);

    // Piece updates on, then a full dump to start from.
    write(make_board_command(proto::SEND_UPDATE_NICE));
    write(make_board_command(proto::SEND_BRD));

    log::info("connected").kv("port", addr).kv("driver", to_string(driver_->kind()));
    connected_.set();
    events_.emit_connected(addr);
    return addr;
  }

  state_ = State::Disconnected;
  log::debug("no candidate could be opened").kv("candidates", candidates.size());
  return std::nullopt;
}

void Connection::disconnect() {
  const bool was_connected = transport_ != nullptr;

  driver_->disconnect();
  if (transport_) {
    if (opts_.lock_port && !transport_->set_exclusive(false))
      log::warn("could not unlock port").kv("port", address_);
    transport_->close();
    transport_.reset();
  }

  interp_.reset();
  connected_.clear();
  for (auto& s : signals_) s->fail(Status::ConnectionLost);
  if (state_ != State::Closed) state_ = State::Disconnected;

  if (was_connected) {
    log::info("disconnected").kv("port", address_);
    address_.clear();
    events_.emit_disconnected();
  }
}

void Connection::close() {
  if (state_ == State::Closed) return;
  state_ = State::Closed;

  // Release waiters with Closed before disconnect() would report ConnectionLost.
  connected_.close();
  for (auto& s : signals_) s->close();
  clock_lock_.close();
  if (beep_timer_) {
    loop_.cancel(*beep_timer_);
    beep_timer_.reset();
    DoneHandler wake = std::move(beep_wake_);
    beep_wake_ = nullptr;
    if (wake) loop_.call_soon([wake] { wake(Status::Closed); });
  }

  disconnect();
  log::info("closed");
  events_.emit_closed();
}

void Connection::write(const std::vector<uint8_t>& bytes) {
  if (state_ != State::Connected || !transport_) {
    log::debug("write dropped, not connected").kv("bytes", bytes.size());
    return;
  }
  log::debug("write").kvq("bytes", hex_dump(bytes));
  driver_->write(bytes);
}

void Connection::send_reset() {
  write(make_board_command(proto::SEND_RESET));
}

// ---------- driver / interpreter callbacks ----------

void Connection::on_frame(const Frame& frame) {
  interp_.process(frame);
}

void Connection::on_driver_error(const std::string& reason) {
  log::debug("dropping link").kv("port", address_).kvq("reason", reason);
  disconnect();
}

void Connection::on_board_changed(const BoardState& board) { events_.emit_board(board); }
void Connection::on_clock_changed(const ClockState& clock) { events_.emit_clock(clock); }
void Connection::on_button_pressed(int button) { events_.emit_button_pressed(button); }
void Connection::on_response(QueryKind kind) { signal(kind).set(); }

void Connection::on_decode_error(DecodeError kind, const std::string& detail) {
  events_.emit_protocol_error(kind, detail);
}

// ---------- queries ----------

void Connection::await_connected(DoneHandler then) {
  connected_.wait(guard([this, then](Status st) {
    // The link may have dropped again between set() and delivery.
    if (st == Status::Ok && state_ != State::Connected) {
      await_connected(then);
      return;
    }
    then(st);
  }));
}

template <typename T, typename Read>
void Connection::query(QueryKind kind, std::vector<uint8_t> request, Read read, ReplyHandler<T> done) {
  signal(kind).clear();
  await_connected(guard([this, kind, request, read, done](Status st) {
    if (st != Status::Ok) {
      Reply<T> r;
      r.status = st;
      done(r);
      return;
    }
    write(request);
    signal(kind).wait(guard([read, done](Status st2) {
      Reply<T> r;
      r.status = st2;
      if (st2 == Status::Ok) r.value = read();
      done(r);
    }));
  }));
}

void Connection::get_version(ReplyHandler<std::string> done) {
  query<std::string>(QueryKind::Version, make_board_command(proto::SEND_VERSION),
                     [this] { return interp_.version(); }, std::move(done));
}

void Connection::get_serial_number(ReplyHandler<std::string> done) {
  query<std::string>(QueryKind::SerialNumber, make_board_command(proto::RETURN_SERIALNR),
                     [this] { return interp_.serial_number(); }, std::move(done));
}

void Connection::get_long_serial_number(ReplyHandler<std::string> done) {
  query<std::string>(QueryKind::LongSerialNumber,
                     make_board_command(proto::RETURN_LONG_SERIALNR),
                     [this] { return interp_.long_serial_number(); }, std::move(done));
}

void Connection::get_battery_status(ReplyHandler<std::string> done) {
  query<std::string>(QueryKind::BatteryStatus, make_board_command(proto::SEND_BATTERY_STATUS),
                     [this] { return interp_.battery_status(); }, std::move(done));
}

void Connection::get_clock_version(ReplyHandler<std::string> done) {
  query<std::string>(QueryKind::ClockVersion, make_clock_version_request(),
                     [this] { return interp_.clock_version(); }, std::move(done));
}

void Connection::get_board(ReplyHandler<BoardState> done) {
  query<BoardState>(QueryKind::Board, make_board_command(proto::SEND_BRD),
                    [this] { return interp_.board(); }, std::move(done));
}

// ---------- clock ----------

void Connection::clock_beep(std::chrono::milliseconds duration, DoneHandler done) {
  const uint8_t intervals = beep_intervals(duration);

  await_connected(guard([this, intervals, done](Status st) {
    if (st != Status::Ok) { done(st); return; }

    clock_lock_.lock(guard([this, intervals, done](Status locked) {
      if (locked != Status::Ok) { done(locked); return; }
      if (state_ != State::Connected) {
        clock_lock_.unlock();
        done(Status::ConnectionLost);
        return;
      }

      signal(QueryKind::ClockAck).clear();
      write(make_clock_beep(intervals));

      // Let the beep sound before looking for the ack.
      const uint64_t session = session_;
      beep_wake_ = guard([this, session, done](Status) { finish_beep(session, done); });
      beep_timer_ = loop_.call_later(
          std::chrono::milliseconds(intervals * proto::CLOCK_BEEP_INTERVAL_MS), [this] {
            beep_timer_.reset();
            DoneHandler wake = std::move(beep_wake_);
            beep_wake_ = nullptr;
            if (wake) wake(Status::Ok);
          });
    }));
  }));
}

void Connection::finish_beep(uint64_t session, DoneHandler done) {
  if (state_ != State::Connected || session != session_) {
    clock_lock_.unlock();
    done(state_ == State::Closed ? Status::Closed : Status::ConnectionLost);
    return;
  }
  signal(QueryKind::ClockAck).wait(guard([this, done](Status st) {
    clock_lock_.unlock();
    done(st);
  }));
}

void Connection::clock_text(const std::string& text_xl, const std::optional<std::string>& text_3000,
                            DoneHandler done) {
  ClockText xl, long_text;
  std::string err;
  if (!center_text(text_xl, proto::CLOCK_XL_WIDTH, xl, err)) throw ConfigurationError(err);
  if (!center_text(text_3000 ? *text_3000 : text_xl, proto::CLOCK_3000_WIDTH, long_text, err))
    throw ConfigurationError(err);

  await_connected(guard([this, xl, long_text, done](Status st) {
    if (st != Status::Ok) { done(st); return; }
    if (!interp_.clock_version().empty()) {
      send_clock_text(xl, long_text, done);
      return;
    }
    get_clock_version([this, xl, long_text, done](const Reply<std::string>& r) {
      if (!r.ok()) { done(r.status); return; }
      send_clock_text(xl, long_text, done);
    });
  }));
}

void Connection::send_clock_text(const ClockText& text_xl, const ClockText& text_3000,
                                 DoneHandler done) {
  clock_lock_.lock(guard([this, text_xl, text_3000, done](Status st) {
    if (st != Status::Ok) { done(st); return; }
    if (state_ != State::Connected) {
      clock_lock_.unlock();
      done(Status::ConnectionLost);
      return;
    }
    // DGT 3000 firmware reports 2.x and takes plain ASCII.
    const bool dgt3000 = interp_.clock_version().rfind("2.", 0) == 0;
    write(dgt3000 ? make_clock_ascii(text_3000) : make_clock_display(text_xl));
    clock_lock_.unlock();
    done(Status::Ok);
  }));
}

} // namespace dgtlink

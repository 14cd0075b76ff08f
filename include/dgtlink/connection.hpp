/**
 * @file connection.hpp
 * @brief One DGT board link: candidate probing, queries, clock commands, events.
 *
 * @details
 * Connection glues the layers together:
 *
 * @code
 *   transport ──bytes──▶ driver ──Frame──▶ Interpreter ──▶ EventHub (subscribers)
 *                                              │
 *                                              └─▶ pending signals ──▶ query replies
 * @endcode
 *
 * Everything runs on the EventLoop thread. The threaded driver marshals its
 * frames and errors onto the loop, so Connection state is never touched from
 * another thread.
 *
 * LIFECYCLE
 * ---------
 *   Disconnected ──connect_once()──▶ Connecting ──▶ Connected
 *        ▲                                              │
 *        └──────────── transport error / disconnect() ──┘
 *   any state ──close()──▶ Closed (terminal)
 *
 * QUERIES
 * -------
 * `get_*()` clear the matching pending signal, wait until connected, send the
 * request and complete when the response frame has been interpreted. The board
 * protocol carries no request id: two concurrent queries of the same kind are
 * both completed by the next matching response. A query in flight during a
 * disconnect completes with Status::ConnectionLost; close() completes every
 * waiter with Status::Closed. Queries issued while disconnected simply wait
 * for the next connection.
 *
 * CLOCK
 * -----
 * clock_beep() and clock_text() are serialized by one AsyncMutex so only one
 * clock command is on the wire at a time.
 *
 * Handlers are dropped (never called) if the Connection is destroyed first.
 */
#ifndef DGTLINK_CONNECTION_HPP
#define DGTLINK_CONNECTION_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dgtlink/board_state.hpp"
#include "dgtlink/clock_state.hpp"
#include "dgtlink/commands.hpp"
#include "dgtlink/driver.hpp"
#include "dgtlink/event_loop.hpp"
#include "dgtlink/events.hpp"
#include "dgtlink/interpreter.hpp"
#include "dgtlink/protocol.hpp"
#include "dgtlink/signal.hpp"
#include "dgtlink/status.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink {

struct ConnectionOptions {
  std::vector<std::string> port_globs;        ///< used by connect_once() without arguments
  bool lock_port{false};                      ///< request TIOCEXCL while connected
  unsigned baud{proto::DEFAULT_BAUD};
  DriverKind driver{DriverKind::Auto};         ///< Auto: chosen from the transport
  transport::TransportFactory transport;      ///< empty → LinuxSerial
};

class Connection : private InterpreterListener {
public:
  enum class State : uint8_t { Disconnected = 0, Connecting = 1, Connected = 2, Closed = 3 };

  Connection(EventLoop& loop, ConnectionOptions opts);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // ---------- link ----------

  /// Expand the configured port globs and try each result in order.
  std::optional<std::string> connect_once();

  /**
   * @brief Open the first candidate that works.
   * @return the chosen address, or std::nullopt when none could be opened
   *         (or the connection is closed).
   *
   * An address is opened, closed and opened again to clear a session left
   * behind by an interrupted process. Afterwards the board is switched to
   * update mode and asked for a full dump, then `connected` is emitted.
   */
  std::optional<std::string> connect_once(const std::vector<std::string>& candidates);

  /// Drop the link. Waiting queries complete with ConnectionLost. Idempotent.
  void disconnect();

  /// Disconnect for good: every waiter completes with Closed, no reconnects.
  void close();

  /// Queue raw bytes for the device. Ignored while not connected.
  void write(const std::vector<uint8_t>& bytes);

  /// Put the board back into idle mode.
  void send_reset();

  // ---------- queries ----------

  void get_version(ReplyHandler<std::string> done);
  void get_serial_number(ReplyHandler<std::string> done);
  void get_long_serial_number(ReplyHandler<std::string> done);
  void get_battery_status(ReplyHandler<std::string> done);
  void get_clock_version(ReplyHandler<std::string> done);
  void get_board(ReplyHandler<BoardState> done);

  // ---------- clock ----------

  /**
   * @brief Beep for @p duration (clamped to 10 s, 64 ms resolution).
   *
   * Completes once the beep had time to sound and the clock acknowledged it.
   */
  void clock_beep(std::chrono::milliseconds duration, DoneHandler done);

  /**
   * @brief Show text on the clock.
   *
   * @p text_xl is centered on the 6-digit DGT XL display; @p text_3000 (or
   * @p text_xl when absent) on the 8-character DGT 3000 display. The clock
   * version decides which one is sent and is fetched first if unknown.
   *
   * @throws ConfigurationError if either text contains non-ASCII characters.
   */
  void clock_text(const std::string& text_xl, const std::optional<std::string>& text_3000,
                  DoneHandler done);

  // ---------- state ----------

  State state() const { return state_; }
  bool closed() const { return state_ == State::Closed; }
  bool connected() const { return state_ == State::Connected; }
  const std::string& address() const { return address_; }
  const BoardState& board() const { return interp_.board(); }
  const std::optional<ClockState>& clock() const { return interp_.clock(); }
  DriverKind driver_kind() const { return driver_->kind(); }
  EventHub& events() { return events_; }

private:
  // InterpreterListener
  void on_board_changed(const BoardState& board) override;
  void on_clock_changed(const ClockState& clock) override;
  void on_button_pressed(int button) override;
  void on_response(QueryKind kind) override;
  void on_decode_error(DecodeError kind, const std::string& detail) override;

  void on_frame(const Frame& frame);
  void on_driver_error(const std::string& reason);

  std::unique_ptr<transport::ITransport> make_transport() const;
  PendingSignal& signal(QueryKind kind) { return *signals_[static_cast<size_t>(kind)]; }

  /// Run @p then once connected (Ok) or closed (Closed).
  void await_connected(DoneHandler then);

  template <typename T, typename Read>
  void query(QueryKind kind, std::vector<uint8_t> request, Read read, ReplyHandler<T> done);

  void send_clock_text(const ClockText& text_xl, const ClockText& text_3000, DoneHandler done);
  void finish_beep(uint64_t session, DoneHandler done);

  /// Wrap an internal continuation so it is skipped once *this is gone.
  DoneHandler guard(DoneHandler fn) const;

  EventLoop& loop_;
  ConnectionOptions opts_;
  EventHub events_;
  Interpreter interp_;
  std::unique_ptr<IDriver> driver_;
  std::unique_ptr<transport::ITransport> transport_;

  State state_{State::Disconnected};
  std::string address_;
  uint64_t session_{0};                       ///< bumped on every successful connect

  PendingSignal connected_;
  std::array<std::unique_ptr<PendingSignal>, static_cast<size_t>(QueryKind::Count)> signals_;
  AsyncMutex clock_lock_;

  std::optional<EventLoop::TimerId> beep_timer_;
  DoneHandler beep_wake_;                     ///< continuation of the pending beep timer

  std::shared_ptr<bool> alive_;
};

const char* to_string(Connection::State s);

} // namespace dgtlink

#endif // DGTLINK_CONNECTION_HPP

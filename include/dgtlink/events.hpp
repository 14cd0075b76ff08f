/**
 * @file events.hpp
 * @brief Typed subscriber channels for connection, board and clock notifications.
 *
 * @details
 * One channel per event kind, each with its own handler signature, so a typo
 * is a compile error instead of a handler that never fires. Dispatch is
 * synchronous and in registration order; handlers may subscribe or
 * unsubscribe while an event is being delivered.
 *
 * @code
 *   auto id = conn.events().on_board([](const dgtlink::BoardState& b) {
 *     std::cout << b.fen().c_str() << "\n";
 *   });
 *   ...
 *   conn.events().remove(id);
 * @endcode
 */
#ifndef DGTLINK_EVENTS_HPP
#define DGTLINK_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "dgtlink/board_state.hpp"
#include "dgtlink/clock_state.hpp"
#include "dgtlink/status.hpp"

namespace dgtlink {

class EventHub {
public:
  using Id = uint32_t;

  using ConnectedFn     = std::function<void(const std::string& address)>;
  using DisconnectedFn  = std::function<void()>;
  using BoardFn         = std::function<void(const BoardState&)>;
  using ClockFn         = std::function<void(const ClockState&)>;
  using ButtonFn        = std::function<void(int button)>;
  using ProtocolErrorFn = std::function<void(DecodeError, const std::string& detail)>;
  using ClosedFn        = std::function<void()>;

  Id on_connected(ConnectedFn fn)          { return add(connected_, std::move(fn)); }
  Id on_disconnected(DisconnectedFn fn)    { return add(disconnected_, std::move(fn)); }
  Id on_board(BoardFn fn)                  { return add(board_, std::move(fn)); }
  Id on_clock(ClockFn fn)                  { return add(clock_, std::move(fn)); }
  Id on_button_pressed(ButtonFn fn)        { return add(button_, std::move(fn)); }
  Id on_protocol_error(ProtocolErrorFn fn) { return add(protocol_error_, std::move(fn)); }
  Id on_closed(ClosedFn fn)                { return add(closed_, std::move(fn)); }

  /// Unsubscribe from whichever channel @p id belongs to.
  void remove(Id id);

  void emit_connected(const std::string& address) { dispatch(connected_, address); }
  void emit_disconnected()                        { dispatch(disconnected_); }
  void emit_board(const BoardState& b)            { dispatch(board_, b); }
  void emit_clock(const ClockState& c)            { dispatch(clock_, c); }
  void emit_button_pressed(int button)            { dispatch(button_, button); }
  void emit_protocol_error(DecodeError e, const std::string& d) { dispatch(protocol_error_, e, d); }
  void emit_closed()                              { dispatch(closed_); }

private:
  template <typename Fn>
  using Channel = std::vector<std::pair<Id, Fn>>;

  template <typename Fn>
  Id add(Channel<Fn>& ch, Fn fn) {
    const Id id = next_id_++;
    ch.emplace_back(id, std::move(fn));
    return id;
  }

  template <typename Fn>
  static bool erase(Channel<Fn>& ch, Id id) {
    for (auto it = ch.begin(); it != ch.end(); ++it) {
      if (it->first == id) { ch.erase(it); return true; }
    }
    return false;
  }

  // Snapshot first so handlers can (un)subscribe during delivery. A handler
  // removed mid-dispatch is skipped if it has not run yet.
  template <typename Fn, typename... Args>
  void dispatch(Channel<Fn>& ch, Args&&... args) {
    const Channel<Fn> snapshot = ch;
    for (const auto& entry : snapshot) {
      if (!contains(ch, entry.first)) continue;
      entry.second(args...);
    }
  }

  template <typename Fn>
  static bool contains(const Channel<Fn>& ch, Id id) {
    for (const auto& e : ch) if (e.first == id) return true;
    return false;
  }

  Id next_id_{1};
  Channel<ConnectedFn>     connected_;
  Channel<DisconnectedFn>  disconnected_;
  Channel<BoardFn>         board_;
  Channel<ClockFn>         clock_;
  Channel<ButtonFn>        button_;
  Channel<ProtocolErrorFn> protocol_error_;
  Channel<ClosedFn>        closed_;
};

inline void EventHub::remove(Id id) {
  if (erase(connected_, id)) return;
  if (erase(disconnected_, id)) return;
  if (erase(board_, id)) return;
  if (erase(clock_, id)) return;
  if (erase(button_, id)) return;
  if (erase(protocol_error_, id)) return;
  erase(closed_, id);
}

} // namespace dgtlink

#endif // DGTLINK_EVENTS_HPP

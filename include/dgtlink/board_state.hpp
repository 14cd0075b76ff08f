/**
 * @file board_state.hpp
 * @brief 64-square piece layout as reported by the board, with FEN-style placement text.
 *
 * @details
 * `BoardState` is a plain value. It knows nothing about serial ports or frames;
 * the interpreter fills it from board dumps and field updates and hands copies
 * to subscribers.
 *
 * @par Square order
 * Index 0 is the far-left square of the far rank as the board sees it, index 63
 * the near-right one. Rows run left to right, far rank first; this is the same
 * order the board uses in its 64-byte dump, so no remapping happens anywhere.
 *
 * @par Piece codes
 * | code | char | code | char |
 * |------|------|------|------|
 * | 0x01 | P    | 0x07 | p    |
 * | 0x02 | R    | 0x08 | r    |
 * | 0x03 | N    | 0x09 | n    |
 * | 0x04 | B    | 0x0A | b    |
 * | 0x05 | K    | 0x0B | k    |
 * | 0x06 | Q    | 0x0C | q    |
 * 0x00 is an empty square. Anything else is rejected, never stored.
 *
 * @par Placement text
 * Eight ranks separated by `/`, each a run of piece letters and digits 1..8
 * for empty squares. Two digits in a row, a rank that does not add up to eight
 * columns, or a rank count other than eight are rejected with a message naming
 * the offending rank; the board is left exactly as it was.
 *
 * @code
 *   dgtlink::BoardState b("rnbqkbnr/pppppppp/8/8/3P4/8/PPP1PPPP/RNBQKBNR");
 *   b.fen();            // same string back
 *   b.clear();
 *   b.fen();            // "8/8/8/8/8/8/8/8"
 * @endcode
 */
#ifndef DGTLINK_BOARD_STATE_HPP
#define DGTLINK_BOARD_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "etl/array.h"
#include "etl/string.h"

namespace dgtlink {

class BoardState {
public:
  static constexpr size_t SQUARES   = 64;
  static constexpr size_t FILES     = 8;
  static constexpr size_t RANKS     = 8;
  static constexpr uint8_t EMPTY    = 0x00;
  static constexpr uint8_t MAX_CODE = 0x0C;

  /// 64 + 7 separators is the longest possible placement string.
  static constexpr size_t FEN_MAX   = SQUARES + RANKS - 1;

  using Squares = etl::array<uint8_t, SQUARES>;
  using FenStr  = etl::string<FEN_MAX>;

  /// Empty board.
  BoardState();

  /**
   * @brief Build from placement text.
   * @throws ConfigurationError if @p fen is malformed.
   */
  explicit BoardState(const std::string& fen);

  /// Placement text for the current layout.
  FenStr fen() const;

  /**
   * @brief Replace the layout from placement text.
   * @throws ConfigurationError naming the offending rank. State is unchanged on failure.
   */
  void set_fen(const std::string& fen);

  /// Non-throwing variant of set_fen(). On failure @p err holds the reason.
  bool try_set_fen(const std::string& fen, std::string& err);

  /**
   * @brief Replace all squares from a raw board dump.
   *
   * Requires exactly 64 codes, each valid. On failure the layout is untouched.
   */
  bool set_squares(const uint8_t* codes, size_t n, std::string& err);

  /// Change one square (field update). Rejects bad index or code without touching state.
  bool set_square(size_t index, uint8_t code, std::string& err);

  uint8_t at(size_t index) const { return squares_[index]; }
  const Squares& squares() const { return squares_; }

  void clear();
  bool empty() const;

  /// 8 lines of space-separated piece chars, '.' for empty squares.
  std::string to_string() const;

  bool operator==(const BoardState& other) const;
  bool operator!=(const BoardState& other) const { return !(*this == other); }

  static bool valid_code(uint8_t code) { return code <= MAX_CODE; }

  /// Letter for a piece code, '.' for empty, '?' for anything unknown.
  static char piece_char(uint8_t code);

  /// Code for a piece letter, EMPTY if @p c is not one.
  static uint8_t piece_code(char c);

private:
  Squares squares_;
};

} // namespace dgtlink

#endif // DGTLINK_BOARD_STATE_HPP

// ============================================================================
// board_state.cpp: implementation for board_state.hpp
// For the square order and piece table see the matching .hpp.
// ============================================================================
#include "dgtlink/board_state.hpp"
#include "dgtlink/status.hpp"

#include <algorithm>

namespace dgtlink {

namespace {

// Index == piece code. Slot 0 is the empty square.
constexpr char PIECE_CHARS[BoardState::MAX_CODE + 1] = {
  '.', 'P', 'R', 'N', 'B', 'K', 'Q', 'p', 'r', 'n', 'b', 'k', 'q'
};

std::string quoted(const std::string& s) { return "'" + s + "'"; }

} // namespace

BoardState::BoardState() {
  clear();
}

BoardState::BoardState(const std::string& fen) {
  clear();
  set_fen(fen);
}

char BoardState::piece_char(uint8_t code) {
  return valid_code(code) ? PIECE_CHARS[code] : '?';
}

uint8_t BoardState::piece_code(char c) {
  for (uint8_t code = 1; code <= MAX_CODE; ++code) {
    if (PIECE_CHARS[code] == c) return code;
  }
  return EMPTY;
}

// ---------- placement text ----------

BoardState::FenStr BoardState::fen() const {
  FenStr out;
  int empty = 0;                                   // run length of empty squares

  for (size_t index = 0; index < SQUARES; ++index) {
    const uint8_t c = squares_[index];
    const bool end_of_rank = (index + 1) % FILES == 0;

    if (c == EMPTY) ++empty;

    // flush the run on a piece or at the end of a rank
    if (empty > 0 && (c != EMPTY || end_of_rank)) {
      out.push_back(static_cast<char>('0' + empty));
      empty = 0;
    }

    if (c != EMPTY) out.push_back(piece_char(c));

    if (end_of_rank && index + 1 < SQUARES) out.push_back('/');
  }
  return out;
}

void BoardState::set_fen(const std::string& fen) {
  std::string err;
  if (!try_set_fen(fen, err)) throw ConfigurationError(err);
}

bool BoardState::try_set_fen(const std::string& fen, std::string& err) {
  // Split into ranks first so the rank count is checked before anything else.
  std::string ranks[RANKS + 1];
  size_t rank_count = 0;
  size_t start = 0;
  while (true) {
    const size_t slash = fen.find('/', start);
    if (rank_count == RANKS) { rank_count++; break; }   // too many ranks
    ranks[rank_count++] = fen.substr(start, slash == std::string::npos ? std::string::npos
                                                                        : slash - start);
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  if (rank_count != RANKS) {
    err = "expected 8 rows in fen: " + quoted(fen);
    return false;
  }

  // Validate and lay out into a scratch array; commit only on success.
  Squares next;
  next.fill(EMPTY);
  size_t square = 0;

  for (size_t r = 0; r < RANKS; ++r) {
    const std::string& rank = ranks[r];
    const std::string row_no = std::to_string(r + 1);
    size_t columns = 0;
    bool previous_was_digit = false;

    for (char c : rank) {
      if (c >= '1' && c <= '8') {
        if (previous_was_digit) {
          err = "two subsequent digits in row " + row_no + " of fen: " + quoted(fen);
          return false;
        }
        columns += static_cast<size_t>(c - '0');
        previous_was_digit = true;
      } else if (piece_code(c) != EMPTY) {
        if (columns < FILES) next[square + columns] = piece_code(c);
        columns += 1;
        previous_was_digit = false;
      } else {
        err = std::string("invalid character '") + c + "' in row " + row_no
            + " of fen: " + quoted(fen);
        return false;
      }
      if (columns > FILES) break;                 // keep writes inside this rank
    }

    if (columns != FILES) {
      err = "expected 8 columns in row " + row_no + " of fen: " + quoted(fen);
      return false;
    }
    square += FILES;
  }

  squares_ = next;
  return true;
}

// ---------- raw updates from the board ----------

bool BoardState::set_squares(const uint8_t* codes, size_t n, std::string& err) {
  if (n != SQUARES) {
    err = "board dump has " + std::to_string(n) + " squares, expected 64";
    return false;
  }
  for (size_t i = 0; i < n; ++i) {
    if (!valid_code(codes[i])) {
      err = "unknown piece code " + std::to_string(codes[i]) + " on square " + std::to_string(i);
      return false;
    }
  }
  std::copy(codes, codes + n, squares_.begin());
  return true;
}

bool BoardState::set_square(size_t index, uint8_t code, std::string& err) {
  if (index >= SQUARES) {
    err = "square index " + std::to_string(index) + " out of range";
    return false;
  }
  if (!valid_code(code)) {
    err = "unknown piece code " + std::to_string(code) + " on square " + std::to_string(index);
    return false;
  }
  squares_[index] = code;
  return true;
}

// ---------- misc ----------

void BoardState::clear() {
  squares_.fill(EMPTY);
}

bool BoardState::empty() const {
  return std::all_of(squares_.begin(), squares_.end(),
                     [](uint8_t c) { return c == EMPTY; });
}

std::string BoardState::to_string() const {
  std::string out;
  out.reserve(SQUARES * 2);
  for (size_t i = 0; i < SQUARES; ++i) {
    out.push_back(piece_char(squares_[i]));
    if (i == SQUARES - 1) break;
    out.push_back(i % FILES == FILES - 1 ? '\n' : ' ');
  }
  return out;
}

bool BoardState::operator==(const BoardState& other) const {
  return std::equal(squares_.begin(), squares_.end(), other.squares_.begin());
}

} // namespace dgtlink

#include "dgtlink/commands.hpp"   // builders and clock text helpers
#include "dgtlink/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace dgtlink {

// ============================================================================
// Low-level helpers
// ============================================================================

// ---------------------------------------------------------------------------
// Start a clock frame: [0x2B][len][0x03][subcommand].
// `len` counts what follows it up to and including the end marker, except for
// the text frames whose lengths are fixed by the device documentation.
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> clock_header(uint8_t len, uint8_t subcommand) {
    std::vector<uint8_t> b;
    b.reserve(16);
    b.push_back(proto::CLOCK_MESSAGE);        // clock command wrapper
    b.push_back(len);                         // frame length byte
    b.push_back(proto::CLOCK_START_MESSAGE);  // start of clock message
    b.push_back(subcommand);                  // what the clock should do
    return b;
}

// ============================================================================
// Board
// ============================================================================

std::vector<uint8_t> make_board_command(uint8_t opcode) {
    return std::vector<uint8_t>{opcode};
}

// ============================================================================
// Clock
// ============================================================================

std::vector<uint8_t> make_clock_version_request() {
    auto b = clock_header(3, proto::CLOCK_SEND_VERSION);
    b.push_back(proto::CLOCK_END_MESSAGE);
    return b;
}

std::vector<uint8_t> make_clock_beep(uint8_t intervals) {
    auto b = clock_header(4, proto::CLOCK_BEEP);
    b.push_back(intervals);                   // duration in 64 ms units
    b.push_back(proto::CLOCK_END_MESSAGE);
    return b;
}

std::vector<uint8_t> make_clock_ascii(const ClockText& t) {
    auto b = clock_header(12, proto::CLOCK_ASCII);
    for (size_t i = 0; i < proto::CLOCK_3000_WIDTH; ++i)
        b.push_back(i < t.size() ? static_cast<uint8_t>(t[i]) : ' ');
    b.push_back(0x01);                        // beep flag: short tick on update
    b.push_back(proto::CLOCK_END_MESSAGE);
    return b;
}

std::vector<uint8_t> make_clock_display(const ClockText& t) {
    static constexpr size_t ORDER[proto::CLOCK_XL_WIDTH] = {2, 1, 0, 5, 4, 3};

    auto b = clock_header(11, proto::CLOCK_DISPLAY);
    for (size_t i : ORDER)
        b.push_back(i < t.size() ? static_cast<uint8_t>(t[i]) : ' ');
    b.push_back(0x00);                        // dots/icons: none
    b.push_back(0x01);                        // beep flag
    b.push_back(proto::CLOCK_END_MESSAGE);
    return b;
}

uint8_t beep_intervals(std::chrono::milliseconds duration) {
    long long ms = duration.count();
    ms = std::min<long long>(ms, proto::CLOCK_BEEP_MAX_MS);
    ms = std::max<long long>(ms, 0);
    const long long n = std::llround(static_cast<double>(ms) / proto::CLOCK_BEEP_INTERVAL_MS);
    return static_cast<uint8_t>(std::max<long long>(n, 1));
}

bool center_text(const std::string& text, size_t width, ClockText& out, std::string& err) {
    out.clear();
    for (unsigned char c : text) {
        if (c > 0x7F) {
            err = "clock text is not ASCII: '" + text + "'";
            return false;
        }
    }
    if (width > out.max_size()) width = out.max_size();

    if (text.size() > width) {
        log::warn("clock text exceeds display").kvq("text", text).kv("width", width);
        out.assign(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(width));
        return true;
    }

    // Left-justify to the midpoint, then right-justify to the full width.
    const size_t left_width = (text.size() + width) / 2;
    const size_t pad_right  = left_width - text.size();
    const size_t pad_left   = width - left_width;

    out.append(pad_left, ' ');
    out.append(text.begin(), text.end());
    out.append(pad_right, ' ');
    return true;
}

std::string hex_dump(const uint8_t* data, size_t n) {
    std::string s;
    s.reserve(n * 3);
    char buf[4];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        if (i) s.push_back(' ');
        s += buf;
    }
    return s;
}

} // namespace dgtlink

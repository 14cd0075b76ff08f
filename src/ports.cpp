// ============================================================================
// ports.cpp: implementation for ports.hpp
// ============================================================================
#include "dgtlink/ports.hpp"

#include <filesystem>         // walk /dev/serial/by-id and resolve links
#include <set>
#include <system_error>       // std::error_code for non-throwing filesystem ops
#include <fnmatch.h>          // fnmatch(3) to test resolved paths against patterns
#include <glob.h>             // glob(3) for pattern expansion

namespace fs = std::filesystem;
namespace dgtlink {

// -------- helpers --------

/*
 * append_glob()
 * -------------
 * Append the expansion of one pattern. GLOB_NOCHECK returns the pattern
 * itself when nothing matches, which keeps literal addresses in the list.
 *
 * Pitfall:
 * - glob() allocates; always globfree().
 */
static void append_glob(std::vector<std::string>& out, const std::string& pattern) {
    glob_t g{};
    if (glob(pattern.c_str(), GLOB_NOCHECK, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i)
            out.emplace_back(g.gl_pathv[i]);
    }
    globfree(&g);
}

/*
 * by_id_devices()
 * ---------------
 * Canonical device paths behind /dev/serial/by-id. Empty when the directory
 * does not exist (no USB serial devices, or udev not running).
 */
static std::vector<std::string> by_id_devices() {
    std::vector<std::string> out;
    const fs::path by_id("/dev/serial/by-id");
    std::error_code ec;
    if (!fs::exists(by_id, ec)) return out;

    for (fs::directory_iterator it(by_id, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_symlink(ec)) continue;
        std::error_code cec;
        auto canon = fs::canonical(it->path(), cec);  // don't throw if the link dangles
        if (!cec) out.push_back(canon.string());
    }
    return out;
}

// -------- public API --------

std::vector<std::string> default_port_globs() {
    return {"/dev/ttyACM*", "/dev/ttyUSB*"};
}

std::vector<std::string> port_candidates(const std::vector<std::string>& globs) {
    std::vector<std::string> raw;
    for (const auto& pattern : globs) append_glob(raw, pattern);

    for (const auto& dev : by_id_devices()) {
        for (const auto& pattern : globs) {
            if (fnmatch(pattern.c_str(), dev.c_str(), 0) == 0) {
                raw.push_back(dev);
                break;
            }
        }
    }

    // Order-preserving de-duplication.
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (auto& p : raw) {
        if (seen.insert(p).second) unique.push_back(std::move(p));
    }
    return unique;
}

std::vector<std::string> list_serial_devices() {
    std::vector<std::string> out = by_id_devices();
    std::vector<std::string> tty;
    for (const char* pattern : {"/dev/ttyACM*", "/dev/ttyUSB*"}) {
        glob_t g{};
        if (glob(pattern, 0, nullptr, &g) == 0) {
            for (size_t i = 0; i < g.gl_pathc; ++i) tty.emplace_back(g.gl_pathv[i]);
        }
        globfree(&g);
    }
    for (auto& t : tty) {
        bool dup = false;
        for (const auto& o : out) dup = dup || o == t;
        if (!dup) out.push_back(std::move(t));
    }
    return out;
}

} // namespace dgtlink

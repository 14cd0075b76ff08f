// tests/support/fake_device.hpp
//
// A socketpair-backed stand-in for a serial port. The connection under test
// gets one end through FakeTransport; the test holds the other end ("peer")
// through FakeBus and plays the board: it writes frames and reads commands.
#pragma once

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "dgtlink/event_loop.hpp"
#include "dgtlink/transport/transport_base.hpp"

namespace dgtlink::testing {

class FakeBus {
public:
    FakeBus() = default;
    explicit FakeBus(std::set<std::string> devices) : devices_(std::move(devices)) {}
    ~FakeBus() {
        for (auto& kv : peers_) if (kv.second >= 0) ::close(kv.second);
    }

    FakeBus(const FakeBus&) = delete;
    FakeBus& operator=(const FakeBus&) = delete;

    void plug(const std::string& name)   { devices_.insert(name); }
    void remove(const std::string& name) { devices_.erase(name); }
    bool present(const std::string& name) const { return devices_.count(name) != 0; }

    // Called by FakeTransport::open(); takes ownership of the board-side end.
    void attach(const std::string& name, int peer_fd) {
        auto it = peers_.find(name);
        if (it != peers_.end() && it->second >= 0) ::close(it->second);
        peers_[name] = peer_fd;
        ++opens_;
    }

    /// Simulate unplugging: the connection sees end-of-stream.
    void unplug(const std::string& name) {
        auto it = peers_.find(name);
        if (it != peers_.end() && it->second >= 0) {
            ::close(it->second);
            it->second = -1;
        }
        devices_.erase(name);
    }

    int peer(const std::string& name) const {
        auto it = peers_.find(name);
        return it == peers_.end() ? -1 : it->second;
    }

    bool send(const std::string& name, const std::vector<uint8_t>& bytes) {
        const int fd = peer(name);
        if (fd < 0) return false;
        size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t n = ::send(fd, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            off += static_cast<size_t>(n);
        }
        return true;
    }

    /// Everything the connection has written so far (non-blocking drain).
    std::vector<uint8_t> received(const std::string& name) {
        std::vector<uint8_t> out;
        const int fd = peer(name);
        if (fd < 0) return out;
        uint8_t buf[256];
        while (true) {
            const ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
            if (n <= 0) break;
            out.insert(out.end(), buf, buf + n);
        }
        return out;
    }

    int opens() const { return opens_; }
    int exclusive_calls{0};

    /// false: transports report no pollable descriptor (fd() == -1), like a
    /// port that only offers blocking reads and writes.
    bool pollable{true};

    transport::TransportFactory factory();

private:
    std::set<std::string> devices_;
    std::map<std::string, int> peers_;
    int opens_{0};
};

class FakeTransport : public transport::ITransport {
public:
    explicit FakeTransport(FakeBus& bus) : bus_(bus) {}
    ~FakeTransport() override { close(); }

    bool open(const transport::SerialConfig& cfg, std::string& err) override {
        close();
        if (!bus_.present(cfg.path)) { err = "no such device: " + cfg.path; return false; }
        int sv[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
            err = "socketpair failed";
            return false;
        }
        fd_ = sv[0];
        bus_.attach(cfg.path, sv[1]);
        return true;
    }

    void close() override {
        if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    }

    bool is_open() const override { return fd_ >= 0; }
    bool supports_readiness() const override { return bus_.pollable; }
    int fd() const override { return bus_.pollable ? fd_ : -1; }

    bool set_blocking(bool blocking) override {
        const int flags = ::fcntl(fd_, F_GETFL, 0);
        if (flags < 0) return false;
        if (::fcntl(fd_, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK)) != 0)
            return false;
        // Blocking reads give up after one read slice, like VTIME on a tty.
        timeval tv{};
        if (blocking) tv.tv_usec = transport::BLOCKING_READ_SLICE_MS * 1000;
        return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    }

    transport::RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
        out_len = 0;
        const ssize_t n = ::read(fd_, out, cap);
        if (n > 0) { out_len = static_cast<size_t>(n); return transport::RxResult::Ok; }
        if (n == 0) return transport::RxResult::Closed;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return transport::RxResult::None;
        return transport::RxResult::Error;
    }

    transport::TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
        written = 0;
        const ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n >= 0) { written = static_cast<size_t>(n); return transport::TxResult::Ok; }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return transport::TxResult::Busy;
        return transport::TxResult::Error;
    }

    bool set_exclusive(bool) override { ++bus_.exclusive_calls; return true; }
    const char* name() const override { return "fake"; }

private:
    FakeBus& bus_;
    int fd_{-1};
};

inline transport::TransportFactory FakeBus::factory() {
    return [this]() -> std::unique_ptr<transport::ITransport> {
        return std::make_unique<FakeTransport>(*this);
    };
}

// ---------- frame helpers ----------

/// Wrap @p payload in a board message header.
inline std::vector<uint8_t> frame(uint8_t id, const std::vector<uint8_t>& payload) {
    const size_t len = payload.size() + 3;
    std::vector<uint8_t> out{id, static_cast<uint8_t>((len >> 7) & 0x7F), static_cast<uint8_t>(len & 0x7F)};
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

/// Drive @p loop until @p pred holds; false on timeout.
template <typename Pred>
bool pump(EventLoop& loop, Pred pred, int timeout_ms = 2000) {
    return loop.run_until([&] { return pred(); }, std::chrono::milliseconds(timeout_ms));
}

} // namespace dgtlink::testing

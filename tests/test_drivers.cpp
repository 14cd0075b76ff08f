#include <doctest/doctest.h>
#include "dgtlink/reactor_driver.hpp"
#include "dgtlink/status.hpp"
#include "dgtlink/threaded_driver.hpp"
#include "support/fake_device.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace dgtlink;
using dgtlink::testing::FakeBus;
using dgtlink::testing::FakeTransport;
using dgtlink::testing::frame;
using dgtlink::testing::pump;

namespace {

const char* DEV = "validdevice";

transport::SerialConfig fake_port() {
    transport::SerialConfig cfg;
    cfg.path = DEV;
    return cfg;
}

} // namespace

TEST_CASE("Reactor registers write interest only while bytes are queued") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));

    std::vector<Frame> frames;
    std::vector<std::string> errors;
    ReactorDriver d(loop, [&](const Frame& f) { frames.push_back(f); },
                    [&](const std::string& why) { errors.push_back(why); });
    REQUIRE(d.configure(t));
    d.connect(t);
    CHECK(d.active());
    CHECK_FALSE(d.writer_registered());              // idle: no writer

    d.write({0x4B});
    d.write({0x42});
    CHECK(d.writer_registered());
    CHECK(d.queued() == 2);

    REQUIRE(pump(loop, [&] { return d.queued() == 0; }));
    CHECK_FALSE(d.writer_registered());              // drained: writer gone
    CHECK(bus.received(DEV) == std::vector<uint8_t>{0x4B, 0x42});

    REQUIRE(bus.send(DEV, frame(0x93, {1, 2})));
    REQUIRE(pump(loop, [&] { return frames.size() == 1; }));
    CHECK(frames[0].payload == std::vector<uint8_t>{1, 2});
    CHECK(errors.empty());

    d.disconnect();
    CHECK_FALSE(d.active());
    CHECK_FALSE(loop.has_reader(t.fd()));
}

TEST_CASE("Reactor reports end of stream once and stops reading") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));

    int error_count = 0;
    ReactorDriver d(loop, [](const Frame&) {}, [&](const std::string&) { ++error_count; });
    REQUIRE(d.configure(t));
    d.connect(t);

    // Half a frame, then the device goes away: nothing partial is delivered.
    REQUIRE(bus.send(DEV, {0x86, 0x00}));
    bus.unplug(DEV);
    REQUIRE(pump(loop, [&] { return error_count == 1; }));
    for (int i = 0; i < 3; ++i) loop.run_once(std::chrono::milliseconds(5));
    CHECK(error_count == 1);
    CHECK_FALSE(loop.has_reader(t.fd()));
}

TEST_CASE("Threaded driver delivers frames on the loop thread") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));

    const auto loop_thread = std::this_thread::get_id();
    std::vector<Frame> frames;
    bool on_loop_thread = true;
    ThreadedDriver d(loop,
                     [&](const Frame& f) {
                         on_loop_thread = on_loop_thread && std::this_thread::get_id() == loop_thread;
                         frames.push_back(f);
                     },
                     [](const std::string&) {});
    REQUIRE(d.configure(t));
    d.connect(t);
    CHECK(d.active());

    d.write({0x4D});
    REQUIRE(bus.send(DEV, frame(0x93, {3, 4})));
    REQUIRE(bus.send(DEV, frame(0x91, {'1', '2'})));
    REQUIRE(pump(loop, [&] { return frames.size() == 2; }));
    CHECK(on_loop_thread);
    CHECK(frames[0].id == 0x93);
    CHECK(frames[1].id == 0x91);

    std::vector<uint8_t> got;
    REQUIRE(pump(loop, [&] {
        const auto b = bus.received(DEV);
        got.insert(got.end(), b.begin(), b.end());
        return !got.empty();
    }));
    CHECK(got == std::vector<uint8_t>{0x4D});

    d.disconnect();
    CHECK_FALSE(d.active());
    d.disconnect();                                   // idempotent
}

TEST_CASE("Threaded driver reports a dropped link through the loop") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));

    std::vector<std::string> errors;
    ThreadedDriver d(loop, [](const Frame&) {}, [&](const std::string& why) { errors.push_back(why); });
    REQUIRE(d.configure(t));
    d.connect(t);

    bus.unplug(DEV);
    REQUIRE(pump(loop, [&] { return errors.size() == 1; }));
    d.disconnect();
    for (int i = 0; i < 3; ++i) loop.run_once(std::chrono::milliseconds(5));
    CHECK(errors.size() == 1);
}

TEST_CASE("Driver factory honors the requested kind") {
    EventLoop loop;
    auto reactor = make_driver(DriverKind::Reactor, loop, [](const Frame&) {}, [](const std::string&) {});
    auto threaded = make_driver(DriverKind::Threaded, loop, [](const Frame&) {}, [](const std::string&) {});
    CHECK(reactor->kind() == DriverKind::Reactor);
    CHECK(threaded->kind() == DriverKind::Threaded);
    CHECK_FALSE(reactor->active());
    CHECK_FALSE(threaded->active());
}

TEST_CASE("Factory refuses an unresolved kind") {
    EventLoop loop;
    CHECK_THROWS_AS(make_driver(DriverKind::Auto, loop, [](const Frame&) {}, [](const std::string&) {}),
                    ConfigurationError);
}

TEST_CASE("Auto picks the driver from the transport's readiness support") {
    FakeBus bus{{DEV}};
    FakeTransport t(bus);

    CHECK(select_driver_kind(DriverKind::Auto, t) == DriverKind::Reactor);
    bus.pollable = false;
    CHECK(select_driver_kind(DriverKind::Auto, t) == DriverKind::Threaded);

    // Forced kinds are taken as given.
    CHECK(select_driver_kind(DriverKind::Reactor, t) == DriverKind::Reactor);
    bus.pollable = true;
    CHECK(select_driver_kind(DriverKind::Threaded, t) == DriverKind::Threaded);
}

TEST_CASE("Reactor refuses a transport it cannot poll") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    bus.pollable = false;
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));

    ReactorDriver d(loop, [](const Frame&) {}, [](const std::string&) {});
    CHECK_FALSE(d.configure(t));
}

TEST_CASE("Threaded driver serves a transport without a pollable descriptor") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    bus.pollable = false;
    FakeTransport t(bus);
    std::string err;
    REQUIRE(t.open(fake_port(), err));
    CHECK(t.fd() == -1);

    std::vector<Frame> frames;
    std::vector<std::string> errors;
    ThreadedDriver d(loop, [&](const Frame& f) { frames.push_back(f); },
                     [&](const std::string& why) { errors.push_back(why); });
    REQUIRE(d.configure(t));
    d.connect(t);

    // Header and payload arrive in separate writes; the reader blocks in between.
    const auto f = frame(0x93, {2, 0});
    REQUIRE(bus.send(DEV, std::vector<uint8_t>(f.begin(), f.begin() + 3)));
    for (int i = 0; i < 3; ++i) loop.run_once(std::chrono::milliseconds(20));
    CHECK(frames.empty());
    REQUIRE(bus.send(DEV, std::vector<uint8_t>(f.begin() + 3, f.end())));
    REQUIRE(pump(loop, [&] { return frames.size() == 1; }));
    CHECK(frames[0].payload == std::vector<uint8_t>{2, 0});

    d.write({0x45});
    std::vector<uint8_t> got;
    REQUIRE(pump(loop, [&] {
        const auto b = bus.received(DEV);
        got.insert(got.end(), b.begin(), b.end());
        return !got.empty();
    }));
    CHECK(got == std::vector<uint8_t>{0x45});

    // A silent board does not hold up shutdown past one read slice.
    const auto t0 = std::chrono::steady_clock::now();
    d.disconnect();
    CHECK(std::chrono::steady_clock::now() - t0 <
          std::chrono::milliseconds(transport::BLOCKING_READ_SLICE_MS * 5));
    CHECK_FALSE(d.active());
    CHECK(errors.empty());
}

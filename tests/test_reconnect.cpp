#include <doctest/doctest.h>
#include "dgtlink/reconnect.hpp"
#include "support/fake_device.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace dgtlink;
using dgtlink::testing::FakeBus;
using dgtlink::testing::pump;
using std::chrono::milliseconds;

namespace {

const char* DEV = "validdevice";

ConnectionOptions fake_options(FakeBus& bus) {
    ConnectionOptions o;
    o.port_globs = {DEV};                      // no such file: glob passes it through
    o.driver = DriverKind::Reactor;
    o.transport = bus.factory();
    return o;
}

} // namespace

TEST_CASE("Backoff doubles from the initial delay up to the cap") {
    Backoff b(milliseconds(500), milliseconds(10000));
    std::vector<long long> seen;
    for (int i = 0; i < 8; ++i) seen.push_back(b.next().count());
    CHECK(seen == std::vector<long long>{500, 1000, 2000, 4000, 8000, 10000, 10000, 10000});

    b.reset();
    CHECK(b.next() == milliseconds(500));

    // A cap below the first delay applies from the second wait on.
    Backoff tight(milliseconds(500), milliseconds(100));
    CHECK(tight.next() == milliseconds(500));
    CHECK(tight.next() == milliseconds(100));
    CHECK(tight.next() == milliseconds(100));
}

TEST_CASE("Without a device the supervisor backs off and stops on close") {
    EventLoop loop;
    FakeBus bus;                                // nothing plugged in
    std::vector<milliseconds> delays;

    ReconnectOptions ro;
    ro.initial_backoff = milliseconds(5);
    ro.max_backoff = milliseconds(40);
    ro.on_backoff = [&](milliseconds d) { delays.push_back(d); };

    AutoConnection ac = auto_connect(loop, fake_options(bus), ro);
    REQUIRE(pump(loop, [&] { return delays.size() >= 6; }));
    CHECK(delays[0] == milliseconds(5));
    CHECK(delays[1] == milliseconds(10));
    CHECK(delays[2] == milliseconds(20));
    CHECK(delays[3] == milliseconds(40));
    CHECK(delays[4] == milliseconds(40));
    CHECK(delays[5] == milliseconds(40));
    CHECK(ac.supervisor->attempts() >= 6);

    ac.connection->close();
    CHECK_FALSE(ac.supervisor->running());
    CHECK_FALSE(ac.supervisor->waiting());

    const auto attempts = ac.supervisor->attempts();
    const auto scheduled = delays.size();
    for (int i = 0; i < 10; ++i) loop.run_once(milliseconds(10));
    CHECK(ac.supervisor->attempts() == attempts);
    CHECK(delays.size() == scheduled);
}

TEST_CASE("The supervisor connects once the board appears and again after replug") {
    EventLoop loop;
    FakeBus bus;
    std::vector<milliseconds> delays;
    ReconnectOptions ro;
    ro.initial_backoff = milliseconds(5);
    ro.max_backoff = milliseconds(20);
    ro.on_backoff = [&](milliseconds d) { delays.push_back(d); };

    AutoConnection ac = auto_connect(loop, fake_options(bus), ro);
    int connected = 0, disconnected = 0;
    ac.connection->events().on_connected([&](const std::string&) { ++connected; });
    ac.connection->events().on_disconnected([&] { ++disconnected; });

    REQUIRE(pump(loop, [&] { return delays.size() >= 3; }));
    CHECK(connected == 0);

    bus.plug(DEV);
    REQUIRE(pump(loop, [&] { return connected == 1; }));
    CHECK(ac.connection->connected());

    // Unplug: the supervisor starts over with the initial delay.
    delays.clear();
    bus.unplug(DEV);
    REQUIRE(pump(loop, [&] { return disconnected == 1 && delays.size() >= 2; }));
    CHECK(delays[0] == milliseconds(5));
    CHECK(delays[1] == milliseconds(10));

    bus.plug(DEV);
    REQUIRE(pump(loop, [&] { return connected == 2; }));

    ac.connection->close();
    CHECK(disconnected == 2);
    CHECK_FALSE(ac.supervisor->running());
}

TEST_CASE("Closing while connected does not trigger a reconnect") {
    EventLoop loop;
    FakeBus bus{{DEV}};
    AutoConnection ac = auto_connect(loop, fake_options(bus));
    REQUIRE(pump(loop, [&] { return ac.connection->connected(); }));
    const auto opens = bus.opens();

    ac.connection->close();
    for (int i = 0; i < 5; ++i) loop.run_once(milliseconds(5));
    CHECK(bus.opens() == opens);
    CHECK(ac.connection->state() == Connection::State::Closed);
    CHECK_FALSE(ac.supervisor->running());
}

TEST_CASE("stop() halts retries but leaves the connection usable") {
    EventLoop loop;
    FakeBus bus;
    ReconnectOptions ro;
    ro.initial_backoff = milliseconds(5);
    ro.max_backoff = milliseconds(5);
    AutoConnection ac = auto_connect(loop, fake_options(bus), ro);
    REQUIRE(pump(loop, [&] { return ac.supervisor->attempts() >= 2; }));

    ac.supervisor->stop();
    const auto attempts = ac.supervisor->attempts();
    for (int i = 0; i < 5; ++i) loop.run_once(milliseconds(5));
    CHECK(ac.supervisor->attempts() == attempts);

    bus.plug(DEV);
    CHECK(ac.connection->connect_once().has_value());
}

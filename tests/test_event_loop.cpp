#include <doctest/doctest.h>
#include "dgtlink/event_loop.hpp"
#include "dgtlink/signal.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace dgtlink;
using std::chrono::milliseconds;

TEST_CASE("call_soon runs in order, after the current callback") {
    EventLoop loop;
    std::vector<int> order;
    loop.call_soon([&] {
        order.push_back(1);
        loop.call_soon([&] { order.push_back(3); });
        order.push_back(2);
    });
    CHECK(loop.run_until([&] { return order.size() == 3; }, milliseconds(500)));
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Timers fire in deadline order and can be cancelled") {
    EventLoop loop;
    std::vector<std::string> fired;
    loop.call_later(milliseconds(30), [&] { fired.push_back("late"); });
    loop.call_later(milliseconds(5), [&] { fired.push_back("early"); });
    const auto never = loop.call_later(milliseconds(10), [&] { fired.push_back("cancelled"); });
    loop.cancel(never);
    loop.cancel(9999);                               // unknown id: ignored

    CHECK(loop.run_until([&] { return fired.size() == 2; }, milliseconds(1000)));
    CHECK(fired == std::vector<std::string>{"early", "late"});
    CHECK(loop.pending_timers() == 0);
}

TEST_CASE("call_soon_threadsafe wakes a blocked loop") {
    EventLoop loop;
    bool ran = false;
    std::thread t([&] {
        std::this_thread::sleep_for(milliseconds(20));
        loop.call_soon_threadsafe([&] { ran = true; });
    });
    CHECK(loop.run_until([&] { return ran; }, milliseconds(2000)));
    t.join();
}

TEST_CASE("Tasks posted from several threads all run on the loop thread") {
    EventLoop loop;
    const auto loop_thread = std::this_thread::get_id();
    int ran = 0;
    bool all_on_loop = true;

    std::vector<std::thread> posters;
    for (int i = 0; i < 4; ++i) {
        posters.emplace_back([&] {
            for (int j = 0; j < 25; ++j) {
                loop.call_soon_threadsafe([&] {
                    all_on_loop = all_on_loop && std::this_thread::get_id() == loop_thread;
                    ++ran;
                });
            }
        });
    }
    for (auto& t : posters) t.join();

    CHECK(loop.run_until([&] { return ran == 100; }, milliseconds(2000)));
    CHECK(all_on_loop);
}

TEST_CASE("Readers see data, writers are called while registered") {
    EventLoop loop;
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    std::string got;
    loop.add_reader(fds[0], [&] {
        char buf[16];
        const ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) got.append(buf, static_cast<size_t>(n));
    });
    int writes = 0;
    loop.add_writer(fds[1], [&] {
        ++writes;
        CHECK(::write(fds[1], "hi", 2) == 2);
        loop.remove_writer(fds[1]);
    });
    CHECK(loop.has_writer(fds[1]));

    CHECK(loop.run_until([&] { return got == "hi"; }, milliseconds(1000)));
    CHECK(writes == 1);
    CHECK_FALSE(loop.has_writer(fds[1]));

    loop.remove_reader(fds[0]);
    CHECK_FALSE(loop.has_reader(fds[0]));
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_CASE("stop() ends run()") {
    EventLoop loop;
    loop.call_later(milliseconds(10), [&] { loop.stop(); });
    loop.run();
    CHECK(true);
}

// ---------- PendingSignal ----------

TEST_CASE("PendingSignal delivers through the loop, never inline") {
    EventLoop loop;
    PendingSignal sig(loop);
    std::vector<Status> got;

    sig.wait([&](Status s) { got.push_back(s); });
    CHECK(sig.waiting() == 1);
    sig.set();
    CHECK(got.empty());                              // posted, not called yet
    CHECK(loop.run_until([&] { return got.size() == 1; }, milliseconds(500)));
    CHECK(got[0] == Status::Ok);

    // Already set: a new waiter completes at once.
    sig.wait([&](Status s) { got.push_back(s); });
    CHECK(loop.run_until([&] { return got.size() == 2; }, milliseconds(500)));

    // Cleared again: the next waiter has to wait for the next set().
    sig.clear();
    sig.wait([&](Status s) { got.push_back(s); });
    loop.run_once(milliseconds(0));
    CHECK(got.size() == 2);
    sig.fail(Status::ConnectionLost);
    CHECK(loop.run_until([&] { return got.size() == 3; }, milliseconds(500)));
    CHECK(got[2] == Status::ConnectionLost);
    CHECK_FALSE(sig.is_set());
}

TEST_CASE("Closing a PendingSignal releases current and future waiters") {
    EventLoop loop;
    PendingSignal sig(loop);
    std::vector<Status> got;
    sig.wait([&](Status s) { got.push_back(s); });
    sig.wait([&](Status s) { got.push_back(s); });
    sig.close();
    sig.set();                                       // no effect after close for new waits
    sig.wait([&](Status s) { got.push_back(s); });
    CHECK(loop.run_until([&] { return got.size() == 3; }, milliseconds(500)));
    for (auto s : got) CHECK(s == Status::Closed);
    CHECK(sig.is_closed());
}

// ---------- AsyncMutex ----------

TEST_CASE("AsyncMutex hands the lock over in FIFO order") {
    EventLoop loop;
    AsyncMutex mu(loop);
    std::vector<int> order;

    mu.lock([&](Status) { order.push_back(1); });
    mu.lock([&](Status) { order.push_back(2); });
    mu.lock([&](Status) { order.push_back(3); });
    CHECK(mu.locked());
    CHECK(mu.waiting() == 2);

    CHECK(loop.run_until([&] { return order.size() == 1; }, milliseconds(500)));
    mu.unlock();
    CHECK(loop.run_until([&] { return order.size() == 2; }, milliseconds(500)));
    CHECK(mu.locked());
    mu.unlock();
    CHECK(loop.run_until([&] { return order.size() == 3; }, milliseconds(500)));
    mu.unlock();
    CHECK_FALSE(mu.locked());
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Closing an AsyncMutex fails queued lockers") {
    EventLoop loop;
    AsyncMutex mu(loop);
    std::vector<Status> got;
    mu.lock([&](Status s) { got.push_back(s); });
    mu.lock([&](Status s) { got.push_back(s); });
    mu.close();
    mu.lock([&](Status s) { got.push_back(s); });
    CHECK(loop.run_until([&] { return got.size() == 3; }, milliseconds(500)));
    CHECK(got[0] == Status::Ok);
    CHECK(got[1] == Status::Closed);
    CHECK(got[2] == Status::Closed);
}

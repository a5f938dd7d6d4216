#include <warden/guarded.hxx>
#include <warden/locks.hxx>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <tuple>
#include <vector>

using namespace std::chrono_literals;
using namespace warden;

static_assert(lockable<spinlock>);
static_assert(!timed_lockable<spinlock>);
static_assert(!shared_lockable<spinlock>);

static_assert(lockable<null_lock>);
static_assert(shared_lockable<null_lock>);

// instrumented forwards exactly the capabilities of the wrapped lock
static_assert(lockable<instrumented<std::mutex>>);
static_assert(!timed_lockable<instrumented<std::mutex>>);
static_assert(!shared_lockable<instrumented<std::mutex>>);
static_assert(timed_lockable<instrumented<std::timed_mutex>>);
static_assert(shared_lockable<instrumented<std::shared_mutex>>);
static_assert(shared_timed_lockable<instrumented<std::shared_timed_mutex>>);
static_assert(lockable<instrumented<spinlock>>);

TEST_CASE("spinlock") {
    spinlock l;

    REQUIRE(l.try_lock());
    REQUIRE_FALSE(l.try_lock());
    l.unlock();

    l.lock();
    REQUIRE_FALSE(l.try_lock());
    l.unlock();
    REQUIRE(l.try_lock());
    l.unlock();
}

TEST_CASE("spinlock serializes a guarded counter") {
    guarded<unsigned, spinlock> counter {0u};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50000; ++i) {
                counter.apply([](unsigned &c) {
                    ++c;
                });
            }
        });
    }

    for (auto &t : threads) {
        t.join();
    }

    REQUIRE(counter.copy() == 200000u);
}

TEST_CASE("null_lock always succeeds") {
    null_lock l;

    l.lock();
    REQUIRE(l.try_lock());
    REQUIRE(l.try_lock_shared());
    l.unlock_shared();
    l.unlock();
    l.unlock();
}

TEST_CASE("instrumented counts acquisitions and failures") {
    lock_monitor monitor("counting", 0us);
    instrumented<std::mutex> l(monitor);

    l.lock();
    {
        auto s = monitor.stats();
        REQUIRE(s.acquisitions == 1);
        REQUIRE(s.holders == 1);
        REQUIRE(s.contended == 0);
    }

    auto probe = std::async(std::launch::async, [&] {
        return l.try_lock();
    });
    REQUIRE_FALSE(probe.get());
    REQUIRE(monitor.stats().failed_attempts == 1);

    l.unlock();
    REQUIRE(monitor.stats().holders == 0);

    REQUIRE(l.try_lock());
    l.unlock();

    auto s = monitor.stats();
    REQUIRE(s.acquisitions == 2);
    REQUIRE(s.peak_holders == 1);
    REQUIRE(s.holders == 0);
}

TEST_CASE("instrumented detects contention") {
    lock_monitor monitor("contention", 0us);
    instrumented<std::mutex> l(monitor);

    l.lock();

    std::promise<void> started;
    auto waiter = std::async(std::launch::async, [&] {
        started.set_value();
        l.lock();
        l.unlock();
    });

    started.get_future().wait();
    std::this_thread::sleep_for(20ms);
    l.unlock();
    waiter.get();

    auto s = monitor.stats();
    REQUIRE(s.acquisitions == 2);
    REQUIRE(s.contended == 1);
    REQUIRE(s.longest_wait >= 10ms);
    REQUIRE(s.holders == 0);

    monitor.reset();
    s = monitor.stats();
    REQUIRE(s.acquisitions == 0);
    REQUIRE(s.contended == 0);
    REQUIRE(s.peak_holders == 0);
    REQUIRE(s.longest_wait == 0ns);

    // a lock held across a reset is still counted and can be released
    l.lock();
    monitor.reset();
    s = monitor.stats();
    REQUIRE(s.acquisitions == 0);
    REQUIRE(s.holders == 1);
    REQUIRE(s.peak_holders == 1);
    l.unlock();
    REQUIRE(monitor.stats().holders == 0);
}

TEST_CASE("Largest slow acquisition threshold") {
    const auto max_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::nanoseconds::max());
    lock_monitor monitor("patient", max_us);
    guarded<int, instrumented<std::mutex>> g(std::piecewise_construct,
                                             std::forward_as_tuple(7),
                                             std::forward_as_tuple(monitor));

    REQUIRE(g.apply([](int &v) {
        return v + 1;
    }) == 8);
    REQUIRE(monitor.slow_threshold() == max_us);
    REQUIRE(monitor.stats().acquisitions == 1);
}

TEST_CASE("instrumented timed acquisition") {
    lock_monitor monitor("timed", 0us);
    instrumented<std::timed_mutex> l(monitor);

    REQUIRE(l.try_lock_for(1ms));

    auto attempt = std::async(std::launch::async, [&] {
        return l.try_lock_for(10ms);
    });
    REQUIRE_FALSE(attempt.get());
    l.unlock();

    REQUIRE(l.try_lock_until(std::chrono::steady_clock::now() + 1ms));
    l.unlock();

    auto s = monitor.stats();
    REQUIRE(s.acquisitions == 2);
    REQUIRE(s.failed_attempts == 1);
    REQUIRE(s.holders == 0);
}

TEST_CASE("instrumented shared lock") {
    lock_monitor monitor("shared", 0us);
    instrumented<std::shared_timed_mutex> l(monitor);

    l.lock_shared();
    REQUIRE(l.try_lock_shared());
    REQUIRE(l.try_lock_shared_for(1ms));
    REQUIRE(monitor.stats().holders == 3);

    auto writer = std::async(std::launch::async, [&] {
        return l.try_lock();
    });
    REQUIRE_FALSE(writer.get());

    l.unlock_shared();
    l.unlock_shared();
    l.unlock_shared();

    auto s = monitor.stats();
    REQUIRE(s.holders == 0);
    REQUIRE(s.peak_holders == 3);
    REQUIRE(s.failed_attempts == 1);
}

TEST_CASE("Several locks can report to one monitor") {
    lock_monitor monitor("pool", 0us);
    guarded<int, instrumented<std::mutex>> a(std::piecewise_construct,
                                             std::forward_as_tuple(1),
                                             std::forward_as_tuple(monitor));
    guarded<int, instrumented<std::mutex>> b(std::piecewise_construct,
                                             std::forward_as_tuple(2),
                                             std::forward_as_tuple(monitor));

    auto sum = warden::apply(
      [](int &x, int &y) {
          return x + y;
      },
      a,
      b);
    REQUIRE(sum == 3);

    auto s = monitor.stats();
    REQUIRE(s.acquisitions >= 2);
    REQUIRE(s.holders == 0);
    REQUIRE(s.peak_holders == 2);

    monitor.report();
}

TEST_CASE("instrumented with its own monitor") {
    guarded<int, instrumented<spinlock>> g {3};

    REQUIRE(g.apply([](int &v) {
        return v * v;
    }) == 9);
}

int main(int argc, char **argv) {
    doctest::Context ctx;

    ctx.setOption("abort-after",
                  1);  // default - stop after 5 failed asserts

    ctx.applyCommandLine(argc, argv);  // apply command line - argc / argv

    ctx.setOption("no-breaks",
                  true);  // override - don't break in the debugger

    int res = ctx.run();  // run test cases unless with --no-run

    if (ctx.shouldExit())  // query flags (and --exit) rely on this
    {
        return res;  // propagate the result of the tests
    }

    return res;
}

#pragma once

// C++ stdlib
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <warden/cxxcommon.hxx>
#include <warden/lockable.hxx>

namespace warden {

/*
 * Test-and-test-and-set spinlock. Cheap when critical sections are
 * short and contention is low; otherwise prefer std::mutex.
 */
class spinlock {
public:
    DISALLOW_COPY_AND_MOVE(spinlock);

    spinlock() noexcept = default;

    void lock() noexcept;
    bool try_lock() noexcept;
    void unlock() noexcept;

private:
    std::atomic<bool> m_locked {false};
};

/*
 * A lock that does nothing. Meant for single-threaded code that uses an
 * API built around guarded objects (the thread_unsafe policy).
 * All acquisitions succeed immediately.
 */
class null_lock {
public:
    constexpr void lock() noexcept {}

    constexpr bool try_lock() noexcept { return true; }

    constexpr void unlock() noexcept {}

    constexpr void lock_shared() noexcept {}

    constexpr bool try_lock_shared() noexcept { return true; }

    constexpr void unlock_shared() noexcept {}
};

/* Snapshot of the counters kept by a lock_monitor. */
struct lock_stats {
    std::uint64_t acquisitions = 0;    /* successful, exclusive or shared */
    std::uint64_t contended = 0;       /* had to block first */
    std::uint64_t failed_attempts = 0; /* try_* that did not acquire */
    std::uint64_t holders = 0;         /* current */
    std::uint64_t peak_holders = 0;
    std::chrono::nanoseconds longest_wait {0};
};

/*
 * Counters shared by one or more instrumented locks.
 *
 * A monitor must outlive the locks reporting to it. It is normally
 * handed to the lock through the piecewise constructor of guarded so
 * that the lock itself stays private to the guarded object.
 *
 * --> name
 * used to identify the lock in log messages.
 *
 * --> slow_threshold
 * acquisitions that had to wait longer than this are logged as warnings;
 * 0 disables the warning. Taken from warden::config::current() when not
 * specified.
 */
class lock_monitor {
public:
    DISALLOW_COPY_AND_MOVE(lock_monitor);

    explicit lock_monitor(
      std::string name = "lock",
      std::optional<std::chrono::microseconds> slow_threshold = std::nullopt);

    void on_acquired(std::chrono::nanoseconds waited, bool contended);
    void on_released();
    void on_failed_attempt();

    lock_stats stats() const;
    void reset();

    /* Log the current counters at info level. */
    void report() const;

    const std::string &name() const { return m_name; }

    std::chrono::microseconds slow_threshold() const { return m_slow_threshold; }

private:
    const std::string m_name;
    const std::chrono::microseconds m_slow_threshold;

    std::atomic<std::uint64_t> m_acquisitions {0};
    std::atomic<std::uint64_t> m_contended {0};
    std::atomic<std::uint64_t> m_failed_attempts {0};
    std::atomic<std::uint64_t> m_holders {0};
    std::atomic<std::uint64_t> m_peak_holders {0};
    std::atomic<std::int64_t> m_longest_wait_ns {0};
};

/*
 * Lock adapter that wraps any basic_lockable Lock and reports every
 * acquisition and release to a lock_monitor. Forwards whichever of the
 * try, timed and shared capabilities Lock has.
 *
 * Holders are counted from the moment the wrapped lock is acquired until
 * just before it is released, so for an exclusive lock the peak number
 * of holders can never exceed 1.
 */
template<basic_lockable Lock = std::mutex>
class instrumented {
public:
    DISALLOW_COPY_AND_MOVE(instrumented);

    /* Report to an internal monitor. */
    instrumented() : m_own(std::in_place), m_monitor(&*m_own) {}

    explicit instrumented(lock_monitor &monitor) : m_monitor(&monitor) {}

    void lock() {
        const auto start = std::chrono::steady_clock::now();
        bool contended = false;

        if constexpr (lockable<Lock>) {
            if (!m_lock.try_lock()) {
                contended = true;
                m_lock.lock();
            }
        } else {
            m_lock.lock();
        }

        m_monitor->on_acquired(std::chrono::steady_clock::now() - start,
                               contended);
    }

    bool try_lock()
        requires lockable<Lock>
    {
        if (!m_lock.try_lock()) {
            m_monitor->on_failed_attempt();
            return false;
        }

        m_monitor->on_acquired(std::chrono::nanoseconds {0}, false);
        return true;
    }

    template<typename Rep, typename Period>
    bool try_lock_for(const std::chrono::duration<Rep, Period> &rel_time)
        requires timed_lockable<Lock>
    {
        return timed(
          [&] {
              return m_lock.try_lock_for(rel_time);
          },
          [&] {
              return m_lock.try_lock();
          });
    }

    template<typename Clock, typename Duration>
    bool try_lock_until(const std::chrono::time_point<Clock, Duration> &abs_time)
        requires timed_lockable<Lock>
    {
        return timed(
          [&] {
              return m_lock.try_lock_until(abs_time);
          },
          [&] {
              return m_lock.try_lock();
          });
    }

    void unlock() {
        m_monitor->on_released();
        m_lock.unlock();
    }

    void lock_shared()
        requires shared_lockable<Lock>
    {
        const auto start = std::chrono::steady_clock::now();
        bool contended = false;

        if (!m_lock.try_lock_shared()) {
            contended = true;
            m_lock.lock_shared();
        }

        m_monitor->on_acquired(std::chrono::steady_clock::now() - start,
                               contended);
    }

    bool try_lock_shared()
        requires shared_lockable<Lock>
    {
        if (!m_lock.try_lock_shared()) {
            m_monitor->on_failed_attempt();
            return false;
        }

        m_monitor->on_acquired(std::chrono::nanoseconds {0}, false);
        return true;
    }

    template<typename Rep, typename Period>
    bool try_lock_shared_for(const std::chrono::duration<Rep, Period> &rel_time)
        requires shared_timed_lockable<Lock>
    {
        return timed(
          [&] {
              return m_lock.try_lock_shared_for(rel_time);
          },
          [&] {
              return m_lock.try_lock_shared();
          });
    }

    template<typename Clock, typename Duration>
    bool
    try_lock_shared_until(const std::chrono::time_point<Clock, Duration> &abs_time)
        requires shared_timed_lockable<Lock>
    {
        return timed(
          [&] {
              return m_lock.try_lock_shared_until(abs_time);
          },
          [&] {
              return m_lock.try_lock_shared();
          });
    }

    void unlock_shared()
        requires shared_lockable<Lock>
    {
        m_monitor->on_released();
        m_lock.unlock_shared();
    }

private:
    /* Probe first so that contention is counted, then fall back to the
     * timed acquisition. */
    template<typename timed_acquire, typename probe>
    bool timed(timed_acquire &&acquire, probe &&try_once) {
        const auto start = std::chrono::steady_clock::now();

        if (try_once()) {
            m_monitor->on_acquired(std::chrono::nanoseconds {0}, false);
            return true;
        }

        if (!acquire()) {
            m_monitor->on_failed_attempt();
            return false;
        }

        m_monitor->on_acquired(std::chrono::steady_clock::now() - start, true);
        return true;
    }

    Lock m_lock;
    std::optional<lock_monitor> m_own;
    lock_monitor *m_monitor;
};

}  // namespace warden

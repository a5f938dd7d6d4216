#include <thread>

#include <warden/config.hxx>
#include <warden/locks.hxx>
#include <warden/log.h>

namespace warden {

using namespace std::chrono;

namespace {

/* Number of busy iterations before a waiting spinlock starts yielding
 * its time slice. */
constexpr unsigned SPINS_BEFORE_YIELD = 64;

}  // namespace

//

void spinlock::lock() noexcept {
    unsigned spins = 0;

    for (;;) {
        if (!m_locked.exchange(true, std::memory_order_acquire)) {
            return;
        }

        // wait for the lock to look free before trying to take it again
        while (m_locked.load(std::memory_order_relaxed)) {
            if (++spins >= SPINS_BEFORE_YIELD) {
                std::this_thread::yield();
            }
        }
    }
}

bool spinlock::try_lock() noexcept {
    return !m_locked.load(std::memory_order_relaxed) &&
           !m_locked.exchange(true, std::memory_order_acquire);
}

void spinlock::unlock() noexcept {
    m_locked.store(false, std::memory_order_release);
}

//

lock_monitor::lock_monitor(std::string name,
                           std::optional<microseconds> slow_threshold)
    : m_name(std::move(name))
    , m_slow_threshold(slow_threshold.has_value()
                         ? *slow_threshold
                         : config::current().slow_acquire_threshold) {
}

void lock_monitor::on_acquired(nanoseconds waited, bool contended) {
    m_acquisitions.fetch_add(1, std::memory_order_relaxed);
    if (contended) {
        m_contended.fetch_add(1, std::memory_order_relaxed);
    }

    auto holders = m_holders.fetch_add(1, std::memory_order_acq_rel) + 1;

    auto peak = m_peak_holders.load(std::memory_order_relaxed);
    while (holders > peak &&
           !m_peak_holders.compare_exchange_weak(
             peak, holders, std::memory_order_relaxed)) {
    }

    auto waited_ns = waited.count();
    auto longest = m_longest_wait_ns.load(std::memory_order_relaxed);
    while (waited_ns > longest &&
           !m_longest_wait_ns.compare_exchange_weak(
             longest, waited_ns, std::memory_order_relaxed)) {
    }

    if (m_slow_threshold.count() > 0 && waited > m_slow_threshold) {
        log_warn("%s: slow acquisition, waited %lld us (threshold %lld us)",
                 m_name.c_str(),
                 static_cast<long long>(duration_cast<microseconds>(waited).count()),
                 static_cast<long long>(m_slow_threshold.count()));
    }
}

void lock_monitor::on_released() {
    m_holders.fetch_sub(1, std::memory_order_acq_rel);
}

void lock_monitor::on_failed_attempt() {
    m_failed_attempts.fetch_add(1, std::memory_order_relaxed);
}

lock_stats lock_monitor::stats() const {
    lock_stats s;
    s.acquisitions = m_acquisitions.load();
    s.contended = m_contended.load();
    s.failed_attempts = m_failed_attempts.load();
    s.holders = m_holders.load();
    s.peak_holders = m_peak_holders.load();
    s.longest_wait = nanoseconds(m_longest_wait_ns.load());
    return s;
}

// NOTE: the current number of holders is not reset; the locks
// being monitored may well be held.
void lock_monitor::reset() {
    m_acquisitions = 0;
    m_contended = 0;
    m_failed_attempts = 0;
    m_peak_holders = m_holders.load();
    m_longest_wait_ns = 0;
}

void lock_monitor::report() const {
    auto s = stats();

    log_info("%s: %llu acquisitions (%llu contended, %llu failed attempts), "
             "%llu holders (peak %llu), longest wait %lld us",
             m_name.c_str(),
             static_cast<unsigned long long>(s.acquisitions),
             static_cast<unsigned long long>(s.contended),
             static_cast<unsigned long long>(s.failed_attempts),
             static_cast<unsigned long long>(s.holders),
             static_cast<unsigned long long>(s.peak_holders),
             static_cast<long long>(
               duration_cast<microseconds>(s.longest_wait).count()));
}

}  // namespace warden

#pragma once

// C++ stdlib
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include <warden/cxxcommon.hxx>
#include <warden/exception.hxx>
#include <warden/lockable.hxx>

namespace warden {

template<typename T, basic_lockable Lock>
class guarded;

namespace impl {

/* Locking modes an accessor can be in; each knows how to give back
 * the lock it was created with. */
struct exclusive_mode {
    template<typename L>
    static void unlock(L &l) {
        l.unlock();
    }
};

struct shared_mode {
    template<typename L>
    static void unlock(L &l) {
        l.unlock_shared();
    }
};

/* The only way into the lock and payload of a guarded object from
 * outside the class. Used by the multi-object apply. */
struct guarded_access {
    template<typename T, basic_lockable Lock>
    static Lock &lock_of(const guarded<T, Lock> &g) {
        return g.m_lock;
    }

    template<typename T, basic_lockable Lock>
    static T &value_of(guarded<T, Lock> &g) {
        return g.m_value;
    }

    template<typename T, basic_lockable Lock>
    static const T &value_of(const guarded<T, Lock> &g) {
        return g.m_value;
    }
};

template<typename G>
struct is_guarded : std::false_type {};

template<typename T, basic_lockable Lock>
struct is_guarded<guarded<T, Lock>> : std::true_type {};

}  // namespace impl

template<typename G>
concept guarded_type = impl::is_guarded<std::remove_cv_t<G>>::value;

/*
 * Scoped handle to the payload of a guarded object.
 *
 * An accessor is only ever created by its guarded object, after the lock
 * has been acquired, and it owns that acquisition: the lock is released
 * exactly once, when the accessor is destroyed, explicitly released, or
 * moved from (in which case the obligation moves with it).
 *
 * --> value_type
 * T for exclusive read-write access, const T for read-only access.
 *
 * --> mode
 * impl::exclusive_mode or impl::shared_mode; determines how the lock
 * is given back.
 *
 * Dereferencing an accessor that does not own the lock throws
 * warden::exception::bad_access (see WARDEN_CHECK_ACCESS).
 */
template<typename value_type, typename Lock, typename mode>
class basic_accessor {
public:
    DISALLOW_COPY(basic_accessor);

    basic_accessor(basic_accessor &&other) noexcept
        : m_lock(std::exchange(other.m_lock, nullptr))
        , m_value(std::exchange(other.m_value, nullptr)) {}

    basic_accessor &operator=(basic_accessor &&other) noexcept {
        if (this != &other) {
            release();
            m_lock = std::exchange(other.m_lock, nullptr);
            m_value = std::exchange(other.m_value, nullptr);
        }
        return *this;
    }

    ~basic_accessor() { release(); }

    value_type &operator*() const {
        WARDEN_CHECK_ACCESS(owns_lock());
        return *m_value;
    }

    value_type *operator->() const {
        WARDEN_CHECK_ACCESS(owns_lock());
        return m_value;
    }

    value_type &get() const {
        WARDEN_CHECK_ACCESS(owns_lock());
        return *m_value;
    }

    bool owns_lock() const noexcept { return m_lock != nullptr; }

    explicit operator bool() const noexcept { return owns_lock(); }

    /* Give back the lock before the end of the scope. NOP if the
     * accessor has already been released or moved from. */
    void release() {
        if (m_lock == nullptr) {
            return;
        }

        Lock *l = std::exchange(m_lock, nullptr);
        m_value = nullptr;
        mode::unlock(*l);
    }

    /*
     * Condition variable waits.
     *
     * The lock of the guarded object is released while blocked and
     * reacquired before returning, exactly as with a std::unique_lock.
     * The accessor owns the lock throughout as far as the caller is
     * concerned. Predicates are called with the payload, with the lock
     * held.
     *
     * Only available to exclusive accessors.
     */
    void wait(std::condition_variable_any &cv)
        requires std::is_same_v<mode, impl::exclusive_mode>
    {
        WARDEN_CHECK_ACCESS(owns_lock());
        cv.wait(*m_lock);
    }

    template<typename predicate>
    void wait(std::condition_variable_any &cv, predicate pred)
        requires std::is_same_v<mode, impl::exclusive_mode>
    {
        WARDEN_CHECK_ACCESS(owns_lock());
        cv.wait(*m_lock, [this, &pred] {
            return std::invoke(pred, *m_value);
        });
    }

    /* Return the value of the predicate on wakeup i.e. false on timeout
     * if the predicate is still not satisfied. */
    template<typename Rep, typename Period, typename predicate>
    bool wait_for(std::condition_variable_any &cv,
                  const std::chrono::duration<Rep, Period> &rel_time,
                  predicate pred)
        requires std::is_same_v<mode, impl::exclusive_mode>
    {
        WARDEN_CHECK_ACCESS(owns_lock());
        return cv.wait_for(*m_lock, rel_time, [this, &pred] {
            return std::invoke(pred, *m_value);
        });
    }

    template<typename Clock, typename Duration, typename predicate>
    bool wait_until(std::condition_variable_any &cv,
                    const std::chrono::time_point<Clock, Duration> &abs_time,
                    predicate pred)
        requires std::is_same_v<mode, impl::exclusive_mode>
    {
        WARDEN_CHECK_ACCESS(owns_lock());
        return cv.wait_until(*m_lock, abs_time, [this, &pred] {
            return std::invoke(pred, *m_value);
        });
    }

private:
    template<typename, basic_lockable>
    friend class guarded;

    // NOTE: the lock must already be held.
    basic_accessor(Lock *lock, value_type *value) noexcept
        : m_lock(lock), m_value(value) {}

    Lock *m_lock;
    value_type *m_value;
};

/*
 * A value bundled with the lock that protects it.
 *
 * The payload can only be reached by acquiring the lock, either through
 * a scoped accessor:
 *
 *     warden::guarded<std::vector<int>> v;
 *     {
 *         auto a = v.lock();
 *         a->push_back(3);
 *     }   // unlocked here
 *
 * or by passing a callable that runs while the lock is held:
 *
 *     auto n = v.apply([](auto &vec) { return vec.size(); });
 *
 * --> Lock
 * Any basic_lockable type. The try, timed and shared members below are
 * only available when Lock has the corresponding capability (see
 * lockable.hxx). The lock is never exposed.
 *
 * A guarded object must outlive every accessor created from it.
 */
template<typename T, basic_lockable Lock = std::mutex>
class guarded {
public:
    using value_type = T;
    using lock_type = Lock;
    using accessor = basic_accessor<T, Lock, impl::exclusive_mode>;
    using const_accessor = basic_accessor<const T, Lock, impl::exclusive_mode>;
    using shared_accessor = basic_accessor<const T, Lock, impl::shared_mode>;

    DISALLOW_COPY_AND_MOVE(guarded);

    guarded() : m_lock(), m_value() {}

    /* Construct the payload in place from the given arguments. */
    template<typename first, typename... rest>
        requires(
          !std::is_same_v<std::remove_cvref_t<first>, guarded> &&
          !std::is_same_v<std::remove_cvref_t<first>, std::piecewise_construct_t>)
    explicit guarded(first &&arg, rest &&...args)
        : m_lock()
        , m_value(std::forward<first>(arg), std::forward<rest>(args)...) {}

    /* Construct the payload and the lock in place from the respective
     * tuple of arguments, e.g.
     *   guarded<int, instrumented<>> g(std::piecewise_construct,
     *                                  std::forward_as_tuple(1),
     *                                  std::forward_as_tuple(monitor));
     */
    template<typename... value_args, typename... lock_args>
    guarded(std::piecewise_construct_t,
            std::tuple<value_args...> vargs,
            std::tuple<lock_args...> largs)
        : m_lock(std::make_from_tuple<Lock>(std::move(largs)))
        , m_value(std::make_from_tuple<T>(std::move(vargs))) {}

    /* Block until the lock is acquired. Any exception thrown by the
     * lock propagates and no accessor is created. */
    [[nodiscard]] accessor lock() {
        m_lock.lock();
        return accessor(&m_lock, &m_value);
    }

    [[nodiscard]] const_accessor lock() const {
        m_lock.lock();
        return const_accessor(&m_lock, &m_value);
    }

    /* Never blocks; empty if the lock is held elsewhere. */
    [[nodiscard]] std::optional<accessor> try_lock()
        requires lockable<Lock>
    {
        if (!m_lock.try_lock()) {
            return std::nullopt;
        }
        return accessor(&m_lock, &m_value);
    }

    [[nodiscard]] std::optional<const_accessor> try_lock() const
        requires lockable<Lock>
    {
        if (!m_lock.try_lock()) {
            return std::nullopt;
        }
        return const_accessor(&m_lock, &m_value);
    }

    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<accessor>
    try_lock_for(const std::chrono::duration<Rep, Period> &rel_time)
        requires timed_lockable<Lock>
    {
        if (!m_lock.try_lock_for(rel_time)) {
            return std::nullopt;
        }
        return accessor(&m_lock, &m_value);
    }

    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<const_accessor>
    try_lock_for(const std::chrono::duration<Rep, Period> &rel_time) const
        requires timed_lockable<Lock>
    {
        if (!m_lock.try_lock_for(rel_time)) {
            return std::nullopt;
        }
        return const_accessor(&m_lock, &m_value);
    }

    template<typename Clock, typename Duration>
    [[nodiscard]] std::optional<accessor>
    try_lock_until(const std::chrono::time_point<Clock, Duration> &abs_time)
        requires timed_lockable<Lock>
    {
        if (!m_lock.try_lock_until(abs_time)) {
            return std::nullopt;
        }
        return accessor(&m_lock, &m_value);
    }

    template<typename Clock, typename Duration>
    [[nodiscard]] std::optional<const_accessor> try_lock_until(
      const std::chrono::time_point<Clock, Duration> &abs_time) const
        requires timed_lockable<Lock>
    {
        if (!m_lock.try_lock_until(abs_time)) {
            return std::nullopt;
        }
        return const_accessor(&m_lock, &m_value);
    }

    /*
     * Shared (reader) access; any number of shared accessors may be alive
     * at the same time, but none while an exclusive accessor is.
     */
    [[nodiscard]] shared_accessor lock_shared() const
        requires shared_lockable<Lock>
    {
        m_lock.lock_shared();
        return shared_accessor(&m_lock, &m_value);
    }

    [[nodiscard]] std::optional<shared_accessor> try_lock_shared() const
        requires shared_lockable<Lock>
    {
        if (!m_lock.try_lock_shared()) {
            return std::nullopt;
        }
        return shared_accessor(&m_lock, &m_value);
    }

    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<shared_accessor>
    try_lock_shared_for(const std::chrono::duration<Rep, Period> &rel_time) const
        requires shared_timed_lockable<Lock>
    {
        if (!m_lock.try_lock_shared_for(rel_time)) {
            return std::nullopt;
        }
        return shared_accessor(&m_lock, &m_value);
    }

    template<typename Clock, typename Duration>
    [[nodiscard]] std::optional<shared_accessor> try_lock_shared_until(
      const std::chrono::time_point<Clock, Duration> &abs_time) const
        requires shared_timed_lockable<Lock>
    {
        if (!m_lock.try_lock_shared_until(abs_time)) {
            return std::nullopt;
        }
        return shared_accessor(&m_lock, &m_value);
    }

    /*
     * Call func(payload) with the lock held and return its result.
     * The lock is released however func exits; if it throws, the
     * exception propagates to the caller after the release.
     *
     * The result is returned by value so that no reference into the
     * payload can outlive the lock.
     */
    template<typename F>
    auto apply(F &&func) {
        auto guard = lock();
        return std::invoke(std::forward<F>(func), m_value);
    }

    /* Read-only variant; the lock is taken in shared mode if Lock
     * supports it. */
    template<typename F>
    auto apply(F &&func) const {
        if constexpr (shared_lockable<Lock>) {
            auto guard = lock_shared();
            return std::invoke(std::forward<F>(func), std::as_const(m_value));
        } else {
            auto guard = lock();
            return std::invoke(std::forward<F>(func), std::as_const(m_value));
        }
    }

    /*
     * Like apply, but never blocks. If the lock is held elsewhere, func
     * is not called and the result is false (func returns void) or an
     * empty optional (otherwise).
     */
    template<typename F>
    auto try_apply(F &&func)
        requires lockable<Lock>
    {
        using result_type = std::decay_t<std::invoke_result_t<F, T &>>;

        auto guard = try_lock();

        if constexpr (std::is_void_v<result_type>) {
            if (!guard) {
                return false;
            }
            std::invoke(std::forward<F>(func), m_value);
            return true;
        } else {
            if (!guard) {
                return std::optional<result_type> {};
            }
            return std::optional<result_type>(
              std::invoke(std::forward<F>(func), m_value));
        }
    }

    /* Snapshot of the payload taken under the lock. */
    T copy() const {
        return apply([](const T &v) {
            return v;
        });
    }

    template<typename U>
    void assign(U &&v) {
        auto guard = lock();
        m_value = std::forward<U>(v);
    }

private:
    friend struct impl::guarded_access;

    mutable Lock m_lock;
    T m_value;
};

namespace impl {

template<typename... G>
void ensure_distinct(const G &...objects) {
    const std::array<const void *, sizeof...(G)> addresses {
      static_cast<const void *>(&objects)...};

    for (std::size_t i = 0; i < addresses.size(); ++i) {
        for (std::size_t j = i + 1; j < addresses.size(); ++j) {
            if (addresses[i] == addresses[j]) {
                exception::do_throwc<exception::bad_value>(
                  "guarded object passed more than once to apply "
                  "(positions %zu and %zu)",
                  i,
                  j);
            }
        }
    }
}

}  // namespace impl

/*
 * Lock several guarded objects at once and call
 * func(payload_1, ..., payload_n) while all of them are held.
 *
 * The locks are acquired with std::lock's deadlock avoidance algorithm,
 * so concurrent calls naming the same objects in a different order do not
 * deadlock. All of them are released however func exits.
 *
 * The same object must not be passed twice: that is reported with
 * warden::exception::bad_value before any lock is taken.
 */
template<typename F, guarded_type... G>
    requires(sizeof...(G) >= 2 && (lockable<typename G::lock_type> && ...))
auto apply(F &&func, G &...objects) {
    impl::ensure_distinct(objects...);

    std::scoped_lock guard(impl::guarded_access::lock_of(objects)...);
    return std::invoke(std::forward<F>(func),
                       impl::guarded_access::value_of(objects)...);
}

}  // namespace warden

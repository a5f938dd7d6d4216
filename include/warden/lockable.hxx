#pragma once

#include <chrono>
#include <concepts>

namespace warden {

/*
 * Lock capabilities, after the standard named requirements
 * (BasicLockable, Lockable, TimedLockable, SharedLockable,
 * SharedTimedLockable). warden::guarded only requires basic_lockable;
 * each further capability enables the corresponding guarded members.
 */

template<typename L>
concept basic_lockable = requires(L &l) {
    l.lock();
    l.unlock();
};

template<typename L>
concept lockable = basic_lockable<L> && requires(L &l) {
    { l.try_lock() } -> std::convertible_to<bool>;
};

template<typename L>
concept timed_lockable =
  lockable<L> &&
  requires(L &l,
           const std::chrono::milliseconds &d,
           const std::chrono::steady_clock::time_point &tp) {
      { l.try_lock_for(d) } -> std::convertible_to<bool>;
      { l.try_lock_until(tp) } -> std::convertible_to<bool>;
  };

template<typename L>
concept shared_lockable = requires(L &l) {
    l.lock_shared();
    l.unlock_shared();
    { l.try_lock_shared() } -> std::convertible_to<bool>;
};

template<typename L>
concept shared_timed_lockable =
  shared_lockable<L> &&
  requires(L &l,
           const std::chrono::milliseconds &d,
           const std::chrono::steady_clock::time_point &tp) {
      { l.try_lock_shared_for(d) } -> std::convertible_to<bool>;
      { l.try_lock_shared_until(tp) } -> std::convertible_to<bool>;
  };

}  // namespace warden

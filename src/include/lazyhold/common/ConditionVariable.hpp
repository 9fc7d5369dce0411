#pragma once

#include <condition_variable>
#include <memory>
#include <utility>

#include "lazyhold/common/Mutex.hpp"

// Condition variable paired with a (possibly shared) mutex. Pass in the mutex
// that guards the predicate state, otherwise wakeups can be lost.
class ConditionVariable
{
public:
  ConditionVariable() {
    mutex_ = std::make_shared<Mutex::type>();
  }
  explicit ConditionVariable(std::shared_ptr<Mutex::type> mtx)
    : mutex_(std::move(mtx)) {}

  Mutex::type &mutex() const { return *mutex_; }

  template <typename Fn>
  void wait(Fn &&fn) {
    Mutex::ulock locker(*mutex_);
    cond_.wait(locker, std::forward<Fn>(fn));
  }
  // caller already holds a lock on the bound mutex
  template <typename Fn>
  void wait(Mutex::ulock &locker, Fn &&fn) {
    cond_.wait(locker, std::forward<Fn>(fn));
  }

  void signalAll() {
    cond_.notify_all();
  }

private:
  std::condition_variable cond_;
  std::shared_ptr<Mutex::type> mutex_;
};

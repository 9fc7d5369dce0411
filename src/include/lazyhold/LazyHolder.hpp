#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "lazyhold/HolderError.hpp"
#include "lazyhold/common/ConditionVariable.hpp"
#include "lazyhold/common/Logger.hpp"
#include "lazyhold/common/Mutex.hpp"
#include "lazyhold/common/noncopyable.hpp"

/**
 * UNINITIALIZED -> INITIALIZING -> INITIALIZED (terminal)
 *        ^               |
 *        +--- failure ---+
 */
enum class HolderState : uint8_t
{
  UNINITIALIZED = 0,
  INITIALIZING,
  INITIALIZED,
};

const char *toString(HolderState state);

/* "lazyhold.LazyHolder" */
Logger::ptr holderLogger();

/**
 * Builds a T at most once, on the first getInstance(), and hands the same
 * instance to every caller.
 *
 * One caller claims INITIALIZING and runs the factory with the lock released;
 * callers arriving meanwhile sleep on the condition variable. If the factory
 * throws (or returns null) the state goes back to UNINITIALIZED, the exception
 * reaches the claiming caller, and woken waiters claim a fresh attempt
 * themselves. Once INITIALIZED the instance is never reset or replaced.
 */
template <typename T>
class LazyHolder : public noncopyable
{
public:
  using ptr = std::shared_ptr<T>;
  using Factory = std::function<ptr()>;
  using State = HolderState;

  explicit LazyHolder(Factory factory, std::string name = "lazy")
    : factory_(std::move(factory))
    , name_(std::move(name))
    , mutex_(std::make_shared<Mutex::type>())
    , cond_(mutex_) {}

  template <typename U = T,
    std::enable_if_t<std::is_default_constructible_v<U>, int> = 0>
  LazyHolder()
    : LazyHolder([] { return std::make_shared<U>(); }) {}

  ~LazyHolder() override = default;

  ptr getInstance();

  State state() const { return state_.load(std::memory_order_acquire); }
  bool isInitialized() const { return state() == State::INITIALIZED; }
  uint64_t attempts() const { return attempts_.load(); }
  uint64_t failures() const { return failures_.load(); }
  const std::string &name() const { return name_; }

private:
  ptr construct(Mutex::ulock &locker);
  void rollback(Mutex::ulock &locker, uint64_t attempt, const char *reason);

private:
  Factory factory_;
  std::string name_;

  std::shared_ptr<Mutex::type> mutex_;
  ConditionVariable cond_;
  std::atomic<State> state_{State::UNINITIALIZED};
  /* guarded by mutex_ */
  std::thread::id owner_;
  /* written once under mutex_ before INITIALIZED is published */
  ptr instance_;

  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> failures_{0};
};

template <typename T>
typename LazyHolder<T>::ptr LazyHolder<T>::getInstance() {
  // pairs with the release store in construct()
  if (state_.load(std::memory_order_acquire) == State::INITIALIZED) {
    return instance_;
  }

  Mutex::ulock locker(*mutex_);
  for (;;) {
    switch (state_.load(std::memory_order_relaxed)) {
    case State::INITIALIZED:
      return instance_;
    case State::INITIALIZING:
      if (owner_ == std::this_thread::get_id()) {
        throw RecursiveInitError(name_);
      }
      ILOG_DEBUG_FMT(holderLogger(), "{}: waiting for construction", name_);
      cond_.wait(locker, [this] {
        return state_.load(std::memory_order_relaxed) != State::INITIALIZING;
      });
      break;
    case State::UNINITIALIZED:
      return construct(locker);
    }
  }
}

template <typename T>
typename LazyHolder<T>::ptr LazyHolder<T>::construct(Mutex::ulock &locker) {
  state_.store(State::INITIALIZING, std::memory_order_relaxed);
  owner_ = std::this_thread::get_id();
  const auto attempt = ++attempts_;
  locker.unlock();

  ILOG_DEBUG_FMT(holderLogger(), "{}: construction attempt {} started", name_, attempt);

  ptr created;
  try {
    created = factory_();
    if (!created) {
      throw NullInstanceError(name_);
    }
  }
  catch (const std::exception &e) {
    rollback(locker, attempt, e.what());
    throw;
  }
  catch (...) {
    rollback(locker, attempt, "non-standard exception");
    throw;
  }

  locker.lock();
  instance_ = std::move(created);
  owner_ = std::thread::id{};
  state_.store(State::INITIALIZED, std::memory_order_release);
  locker.unlock();
  cond_.signalAll();

  ILOG_INFO_FMT(holderLogger(), "{}: constructed on attempt {}", name_, attempt);
  return instance_;
}

template <typename T>
void LazyHolder<T>::rollback(
  Mutex::ulock &locker, uint64_t attempt, const char *reason) {
  ++failures_;
  locker.lock();
  owner_ = std::thread::id{};
  state_.store(State::UNINITIALIZED, std::memory_order_release);
  locker.unlock();
  cond_.signalAll();

  ILOG_ERROR_FMT(holderLogger(), "{}: construction attempt {} failed: {}",
    name_, attempt, reason);
}

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "lazyhold/common/Mutex.hpp"
#include "lazyhold/common/noncopyable.hpp"

struct ThreadContext
{
  std::thread::id id{};
  std::string name{"undefined"};

  ThreadContext() {}
  ThreadContext(std::thread::id threadId, std::string_view threadName)
    : id(threadId)
    , name(threadName) {}
};

/**
 * A named worker thread. The name is registered for the lifetime of the
 * dispatched task so log lines can print it; the thread is joined on
 * destruction.
 */
class Thread : public noncopyable
{
public:
  Thread() = default;
  explicit Thread(std::string_view name)
    : name_(name) {}
  Thread(Thread &&th) noexcept
    : name_(std::move(th.name_))
    , thread_(std::move(th.thread_)) {}
  ~Thread() override { this->stop(); }

  template <typename Fn, typename... Args>
  std::future<std::invoke_result_t<Fn, Args...>> dispatch(
    Fn &&fn, Args &&...args) {
    using ResultType = std::invoke_result_t<Fn, Args...>;

    this->stop();

    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<Fn>(fn), std::forward<Args>(args)...));
    auto res = task->get_future();

    thread_ = std::thread([task, name = name_] {
      Thread::setCurrentName(name);
      (*task)();
      Thread::clearCurrentName();
    });
    return res;
  }

  void join() { thread_.join(); }
  void stop() {
    if (thread_.joinable()) thread_.join();
  }
  bool isJoinable() const { return thread_.joinable(); }
  const std::string &getName() const { return name_; }
  std::thread::id getId() const { return thread_.get_id(); }

  static void setCurrentName(std::string_view name) {
    RWMutex::wlock locker(s_mutex);
    auto tid = std::this_thread::get_id();
    s_thread_mapping[tid] = ThreadContext{tid, name};
  }
  static void clearCurrentName() {
    RWMutex::wlock locker(s_mutex);
    s_thread_mapping.erase(std::this_thread::get_id());
  }

  static ThreadContext context(std::thread::id tid) {
    RWMutex::rlock locker(s_mutex);
    auto it = s_thread_mapping.find(tid);
    if (it != s_thread_mapping.end()) return it->second;

    return {};
  }
  static std::string name(std::thread::id tid) { return context(tid).name; }
  static bool include(std::thread::id tid) {
    RWMutex::rlock locker(s_mutex);
    return s_thread_mapping.find(tid) != s_thread_mapping.end();
  }

private:
  std::string name_{"undefined"};
  std::thread thread_;

  static inline RWMutex::type s_mutex;
  static inline std::unordered_map<std::thread::id, ThreadContext>
    s_thread_mapping = {};
};

#include <atomic>
#include <future>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

#include "lazyhold/DemoConfig.hpp"
#include "lazyhold/LazyHolder.hpp"
#include "lazyhold/common/Logger.hpp"
#include "lazyhold/common/Thread.hpp"
#include "lazyhold/common/Time.hpp"

#include <fmt/core.h>

namespace
{
struct ExpensiveObject
{
  explicit ExpensiveObject(uint64_t attempt) : built_on_attempt(attempt) {}

  uint64_t built_on_attempt;
};

// keeps calling until a construction succeeds, as a real caller would
const ExpensiveObject *callUntilReady(LazyHolder<ExpensiveObject> &holder) {
  for (;;) {
    try {
      return holder.getInstance().get();
    }
    catch (const std::runtime_error &e) {
      LOG_WARN_FMT("getInstance() failed, retrying: {}", e.what());
    }
  }
}
}  // namespace

int main(int argc, char *argv[]) {
  Thread::setCurrentName("main");

  DemoConfig config;
  try {
    if (argc > 1) config = DemoConfig::loadYamlFile(argv[1]);
    if (!config.log_config.empty()) {
      LogIniter::loadYamlFile(config.log_config);
    }
    else {
      LogIniter::reg("lazyhold", LogIniterFlag::CONSOLE, LogLevel::LINFO, kThreadFormatPattern);
    }
  }
  catch (const YAML::Exception &e) {
    LOG_ERROR_FMT("cannot load configuration: {}", e.what());
    return 2;
  }
  catch (const std::invalid_argument &e) {
    LOG_ERROR_FMT("invalid configuration: {}", e.what());
    return 2;
  }
  LOG_INFO_FMT("configuration:\n{}", config.dump2YamlString());

  std::atomic<int> attempts{0};
  std::atomic<int> constructions{0};
  LazyHolder<ExpensiveObject> holder(
    [&] {
      Time::sleepMs(config.construction_delay_ms);
      const int attempt = ++attempts;
      if (attempt <= config.failing_attempts) {
        throw std::runtime_error(fmt::format("simulated failure on attempt {}", attempt));
      }
      ++constructions;
      return std::make_shared<ExpensiveObject>(attempt);
    },
    "demo.ExpensiveObject");

  auto begin = Time::now();
  std::vector<std::unique_ptr<Thread>> threads;
  std::vector<std::future<const ExpensiveObject *>> results;
  threads.reserve(config.callers);
  results.reserve(config.callers);
  for (int i = 0; i < config.callers; ++i) {
    auto th = std::make_unique<Thread>(fmt::format("caller-{}", i));
    results.push_back(th->dispatch([&holder] { return callUntilReady(holder); }));
    threads.push_back(std::move(th));
  }

  std::set<const ExpensiveObject *> identities;
  for (auto &res : results) {
    identities.insert(res.get());
  }
  threads.clear();

  const auto elapsed = Time::elapse<std::chrono::milliseconds>(begin).count();
  LOG_INFO_FMT("callers={} attempts={} failures={} constructions={} "
               "distinct_instances={} state={} elapsed={}ms",
    config.callers, holder.attempts(), holder.failures(), constructions.load(),
    identities.size(), toString(holder.state()), elapsed);

  if (constructions.load() != 1 || identities.size() != 1) {
    LOG_ERROR_FMT("at-most-once construction violated");
    return 1;
  }
  return 0;
}

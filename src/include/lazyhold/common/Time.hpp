#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <thread>

#include "lazyhold/common/Platform.hpp"

class Time
{
public:
  using BaseClockType = std::chrono::steady_clock;
  using BaseTimePoint = std::chrono::time_point<BaseClockType>;

  static BaseTimePoint now() {
    return BaseClockType::now();
  }
  static void sleepMs(int64_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
  template <typename TimeType>
  static TimeType elapse(BaseTimePoint begin, BaseTimePoint end = now()) {
    return std::chrono::duration_cast<TimeType>(end - begin);
  }

  // milliseconds since epoch, wall clock
  static int64_t timestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch())
      .count();
  }

  static struct tm localTime(time_t t) {
    struct tm tm;
#if defined(__LINUX__)
    ::localtime_r(&t, &tm);
#elif defined(__WIN__)
    ::localtime_s(&tm, &t);
#endif
    return tm;
  }
  static std::string toFormatString(
    int64_t timestampMs, const char *fmt = "%Y-%m-%d %H:%M:%S") {
    char buf[64];
    struct tm tm = localTime(static_cast<time_t>(timestampMs / 1000));
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string{buf};
  }
};

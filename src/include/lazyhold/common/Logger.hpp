#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "lazyhold/common/Mutex.hpp"
#include "lazyhold/common/Thread.hpp"
#include "lazyhold/common/Time.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#define __LogEventGen(level)                                                  \
  std::make_shared<LogEvent>(level, std::this_thread::get_id(), __FILE__,     \
    __LINE__, __FUNCTION__, Time::timestamp())

#define __LogEventWrapperGen(pLogger, level) \
  std::make_shared<LogEventWrapper>(__LogEventGen(level), pLogger)

#define __LOG_STREAM(pLogger, level) \
  __LogEventWrapperGen(pLogger, level)->getSS()

#define __LOG_FMT(pLogger, level, fmt, ...)    \
  __LogEventWrapperGen(pLogger, level)         \
    ->getEvent()                               \
    ->format(fmt, ##__VA_ARGS__)

#define LOG_ROOT()       LogManager::instance()->getRoot()
#define GET_LOGGER(name) LogManager::instance()->getLogger(name)

#define ILOG_TRACE_FMT(pLogger, fmt, ...)    __LOG_FMT(pLogger, LogLevel::LTRACE, fmt, ##__VA_ARGS__)
#define ILOG_DEBUG_FMT(pLogger, fmt, ...)    __LOG_FMT(pLogger, LogLevel::LDEBUG, fmt, ##__VA_ARGS__)
#define ILOG_INFO_FMT(pLogger, fmt, ...)     __LOG_FMT(pLogger, LogLevel::LINFO, fmt, ##__VA_ARGS__)
#define ILOG_WARN_FMT(pLogger, fmt, ...)     __LOG_FMT(pLogger, LogLevel::LWARN, fmt, ##__VA_ARGS__)
#define ILOG_ERROR_FMT(pLogger, fmt, ...)    __LOG_FMT(pLogger, LogLevel::LERROR, fmt, ##__VA_ARGS__)
#define ILOG_CRITICAL_FMT(pLogger, fmt, ...) __LOG_FMT(pLogger, LogLevel::LCRITICAL, fmt, ##__VA_ARGS__)
#define ILOG_FATAL_FMT(pLogger, fmt, ...)    __LOG_FMT(pLogger, LogLevel::LFATAL, fmt, ##__VA_ARGS__)

#define ILOG_TRACE(pLogger)    __LOG_STREAM(pLogger, LogLevel::LTRACE)
#define ILOG_DEBUG(pLogger)    __LOG_STREAM(pLogger, LogLevel::LDEBUG)
#define ILOG_INFO(pLogger)     __LOG_STREAM(pLogger, LogLevel::LINFO)
#define ILOG_WARN(pLogger)     __LOG_STREAM(pLogger, LogLevel::LWARN)
#define ILOG_ERROR(pLogger)    __LOG_STREAM(pLogger, LogLevel::LERROR)
#define ILOG_CRITICAL(pLogger) __LOG_STREAM(pLogger, LogLevel::LCRITICAL)
#define ILOG_FATAL(pLogger)    __LOG_STREAM(pLogger, LogLevel::LFATAL)

#define LOG_TRACE_FMT(fmt, ...)    ILOG_TRACE_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_DEBUG_FMT(fmt, ...)    ILOG_DEBUG_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_INFO_FMT(fmt, ...)     ILOG_INFO_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_WARN_FMT(fmt, ...)     ILOG_WARN_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_ERROR_FMT(fmt, ...)    ILOG_ERROR_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_CRITICAL_FMT(fmt, ...) ILOG_CRITICAL_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)
#define LOG_FATAL_FMT(fmt, ...)    ILOG_FATAL_FMT(LOG_ROOT(), fmt, ##__VA_ARGS__)

#define LOG_TRACE()    ILOG_TRACE(LOG_ROOT())
#define LOG_DEBUG()    ILOG_DEBUG(LOG_ROOT())
#define LOG_INFO()     ILOG_INFO(LOG_ROOT())
#define LOG_WARN()     ILOG_WARN(LOG_ROOT())
#define LOG_ERROR()    ILOG_ERROR(LOG_ROOT())
#define LOG_CRITICAL() ILOG_CRITICAL(LOG_ROOT())
#define LOG_FATAL()    ILOG_FATAL(LOG_ROOT())

// 2023-03-01 12:00:00    worker-3[140245]    lazyhold.LazyHolder[DEBUG]    LazyHolder.hpp:88    getInstance | message
inline constexpr const char *kDefaultFormatPattern =
  "$DATETIME{%Y-%m-%d %H:%M:%S}"
  "$CHAR:\t$THREAD_NAME$CHAR:[$THREAD_ID$CHAR:]"
  "$CHAR:\t$LOG_NAME$CHAR:[$LOG_LEVEL$CHAR:]"
  "$CHAR:\t$FILENAME$CHAR::$LINE"
  "$CHAR:\t$FUNCTION_NAME"
  "$CHAR: | $MESSAGE$CHAR:\n";
// 2023-03-01 12:00:00    [DEBUG]    worker-3    message
inline constexpr const char *kThreadFormatPattern =
  "$DATETIME{%Y-%m-%d %H:%M:%S}"
  "$CHAR:\t$CHAR:[$LOG_LEVEL$CHAR:]"
  "$CHAR:\t$THREAD_NAME"
  "$CHAR:\t$MESSAGE$CHAR:\n";
// 2023-03-01 12:00:00    [DEBUG]    message
inline constexpr const char *kBriefFormatPattern =
  "$DATETIME{%Y-%m-%d %H:%M:%S}"
  "$CHAR:\t$CHAR:[$LOG_LEVEL$CHAR:]"
  "$CHAR:\t$MESSAGE$CHAR:\n";

enum LogIniterFlag : uint8_t {
  CONSOLE = 0x01,
  SYNC_FILE = 0x02,
};

class LogLevel
{
public:
  enum Level : uint8_t
  {
    LUNKNOWN = 0,
    LTRACE = 1,
    LDEBUG = 2,
    LINFO = 3,
    LWARN = 4,
    LERROR = 5,
    LCRITICAL = 6,
    LFATAL = 7,
    LCLOSE = 8,
  };

  LogLevel(LogLevel::Level level = LUNKNOWN) : level_(level) {}

  Level level() const { return level_; }
  std::string toString() const;

  bool operator<(const LogLevel &rhs) const { return level_ < rhs.level_; }
  bool operator>(const LogLevel &rhs) const { return level_ > rhs.level_; }
  bool operator<=(const LogLevel &rhs) const { return level_ <= rhs.level_; }
  bool operator>=(const LogLevel &rhs) const { return level_ >= rhs.level_; }
  bool operator==(const LogLevel &rhs) const { return level_ == rhs.level_; }
  bool operator!=(const LogLevel &rhs) const { return level_ != rhs.level_; }

  /* case-insensitive, LUNKNOWN when unrecognized */
  static LogLevel fromString(std::string_view str);

private:
  Level level_;
};

struct LogColorConfig
{
  static constexpr const char *kEnd = "\033[0m";

  static const char *getColor(LogLevel level) {
    switch (level.level()) {
    case LogLevel::LTRACE:    return "\033[36m";
    case LogLevel::LDEBUG:    return "\033[34m";
    case LogLevel::LINFO:     return "\033[32m";
    case LogLevel::LWARN:     return "\033[33m";
    case LogLevel::LERROR:    return "\033[31m";
    case LogLevel::LCRITICAL: return "\033[35m";
    case LogLevel::LFATAL:    return "\033[31;2m";
    default:                  return kEnd;
    }
  }
};

class Logger;

class LogEvent
{
public:
  using ptr = std::shared_ptr<LogEvent>;

  LogEvent(LogLevel level, std::thread::id tid, const std::string &filename,
    int32_t line, const std::string &functionName, int64_t timestamp);

  const std::string &getFilename() const { return filename_; }
  const std::string &getFunctionName() const { return function_name_; }
  int32_t getLine() const { return line_; }
  int64_t getTimestamp() const { return timestamp_; }
  std::string getContent() const { return ss_.str(); }
  std::thread::id getThreadId() const { return tid_; }
  std::string getThreadName() const { return Thread::name(tid_); }
  LogLevel getLevel() const { return level_; }
  std::stringstream &getSS() { return ss_; }

  template <typename... Args>
  void format(::fmt::string_view fmt, const Args &...args) {
    ss_ << ::fmt::vformat(fmt, ::fmt::make_format_args(args...));
  }

private:
  std::thread::id tid_;
  std::string filename_;
  std::string function_name_;
  int32_t line_ = 0;
  int64_t timestamp_ = 0;
  std::stringstream ss_;
  LogLevel level_;
};

struct LogFormatterItem
{
  using ptr = std::shared_ptr<LogFormatterItem>;

  LogFormatterItem() = default;
  virtual ~LogFormatterItem() = default;

  virtual void format(std::ostream &os, const LogEvent &event,
    const Logger &logger) = 0;
};

class LogFormatter
{
public:
  using ptr = std::shared_ptr<LogFormatter>;

  static constexpr char ID_TOKEN = '$';

  LogFormatter(const std::string &pattern = kDefaultFormatPattern);

  std::string format(const LogEvent &event, const Logger &logger) const;
  std::ostream &format(
    std::ostream &os, const LogEvent &event, const Logger &logger) const;

  bool hasError() const { return has_error_; }
  const std::string &lastError() const { return error_; }
  const std::string &getPattern() const { return pattern_; }

  YAML::Node toYaml() const;

private:
  void init();

private:
  std::string pattern_;
  std::vector<LogFormatterItem::ptr> items_;
  std::string error_;
  bool has_error_{false};
};

class LogAppender
{
public:
  using ptr = std::shared_ptr<LogAppender>;

  LogAppender() = default;
  virtual ~LogAppender() = default;

  virtual void log(const LogEvent &event, const Logger &logger) = 0;
  virtual YAML::Node toYaml() const = 0;

  void setFormatter(LogFormatter::ptr pFormatter);
  LogFormatter::ptr getFormatter() const;

  LogLevel getLevel() const { return level_; }
  void setLevel(LogLevel level) { level_ = level; }

protected:
  YAML::Node baseYaml(const char *type) const;

protected:
  LogLevel level_{LogLevel::LTRACE};
  LogFormatter::ptr formatter_;

  mutable Mutex::type mutex_;
};

/* writes plain formatted lines to any stream, the stream must outlive the appender */
class StreamLogAppender : public LogAppender
{
public:
  using ptr = std::shared_ptr<StreamLogAppender>;

  explicit StreamLogAppender(std::ostream &os) : os_(os) {}
  ~StreamLogAppender() override = default;

  void log(const LogEvent &event, const Logger &logger) override;
  YAML::Node toYaml() const override;

protected:
  std::ostream &os_;
};

class StdoutLogAppender : public StreamLogAppender
{
public:
  using ptr = std::shared_ptr<StdoutLogAppender>;

  StdoutLogAppender() : StreamLogAppender(std::cout) {}
  ~StdoutLogAppender() override = default;

  void log(const LogEvent &event, const Logger &logger) override;
  YAML::Node toYaml() const override;
};

class FileLogAppender : public LogAppender
{
public:
  using ptr = std::shared_ptr<FileLogAppender>;

  static inline uint64_t kMaxFileLines = 50000;

  FileLogAppender(const std::string &dir, const std::string &filename);
  ~FileLogAppender() override = default;

  void log(const LogEvent &event, const Logger &logger) override;
  YAML::Node toYaml() const override;

  /* dir + filename + "_" + day + "_" + cnt{02d} + ".log" */
  std::string getWholeFilename(int64_t timestamp) const;

private:
  bool reopenIfShould(int64_t timestamp);

private:
  std::string dir_;
  std::string filename_;
  std::ofstream file_stream_;
  uint64_t lines_{0};
  uint32_t cnt_{0};
  int today_{-1};
};

class Logger
{
public:
  using ptr = std::shared_ptr<Logger>;

  Logger(const std::string &name = "root", LogLevel level = LogLevel::LINFO,
    const std::string &pattern = kDefaultFormatPattern);
  ~Logger() = default;

  void log(const LogEvent &event);
  bool isEnabled(LogLevel level) const { return level >= getLevel(); }

  void addAppender(LogAppender::ptr pAppender);
  void removeAppender(LogAppender::ptr pAppender);
  void clearAppenders();
  std::list<LogAppender::ptr> getAppenders() const;

  YAML::Node toYaml() const;

  LogLevel getLevel() const { return LogLevel(level_.load()); }
  void setLevel(LogLevel level) { level_ = level.level(); }
  const std::string &getName() const { return name_; }

  void setFormatter(LogFormatter::ptr pFormatter);
  void setFormatter(const std::string &pattern);
  LogFormatter::ptr getFormatter() const;

  Logger::ptr getParent() const;
  void setParent(Logger::ptr pLogger);

private:
  std::string name_;
  std::atomic<LogLevel::Level> level_;
  std::list<LogAppender::ptr> appenders_;
  LogFormatter::ptr formatter_;
  Logger::ptr parent_;

  mutable Mutex::type mutex_;
};

class LogEventWrapper
{
public:
  using ptr = std::shared_ptr<LogEventWrapper>;

  LogEventWrapper(LogEvent::ptr pEvent, Logger::ptr pLogger);
  ~LogEventWrapper() { logger_->log(*event_); }

  LogEvent::ptr getEvent() const { return event_; }
  Logger::ptr getLogger() const { return logger_; }
  std::stringstream &getSS() { return event_->getSS(); }

private:
  LogEvent::ptr event_;
  Logger::ptr logger_;
};

class LogManager
{
public:
  // never destroyed, loggers stay usable during static destruction
  static LogManager *instance() {
    static LogManager *manager = new LogManager();
    return manager;
  }

  /* find or create; "a.b.c" also creates "a" and "a.b" as its parents */
  Logger::ptr getLogger(const std::string &name);
  Logger::ptr findLogger(const std::string &name) const;
  Logger::ptr getRoot() const { return root_; }

  std::string getLogDir() const;
  void setLogDir(const std::string &dir);

  YAML::Node toYaml() const;
  std::string toYamlString() const;

private:
  LogManager();

  Logger::ptr getLoggerLocked(const std::string &name);

private:
  mutable Mutex::type mutex_;
  std::map<std::string, Logger::ptr> loggers_;
  Logger::ptr root_;
  std::string log_dir_{"./logs/"};
};

class LogIniter
{
public:
  static constexpr const char *kSplit = ".";

  /* (re)configure the named logger with fresh appenders chosen by flags */
  static Logger::ptr reg(const std::string &name,
    uint8_t flags = LogIniterFlag::CONSOLE, LogLevel level = LogLevel::LDEBUG,
    const std::string &pattern = kDefaultFormatPattern);

  /* throws YAML::Exception on unreadable or malformed input */
  static void loadYamlFile(const std::string &filename);
  static void loadYamlNode(const YAML::Node &node);

private:
  static LogAppender::ptr parseAppender(const YAML::Node &node);
};

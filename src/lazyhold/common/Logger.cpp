#include <algorithm>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include <lazyhold/common/Logger.hpp>
#include <lazyhold/common/OSUtil.hpp>
#include <lazyhold/common/StringUtil.hpp>

/********************************************* LogLevel
 * **********************************************/
std::string LogLevel::toString() const {
  switch (level_) {
#define XX(x) \
  case LogLevel::Level::L##x: return #x;

    XX(TRACE)
    XX(DEBUG)
    XX(INFO)
    XX(WARN)
    XX(ERROR)
    XX(CRITICAL)
    XX(FATAL)
    XX(CLOSE)
#undef XX

  case LogLevel::Level::LUNKNOWN:
  default: return "NONE";
  }
}

LogLevel LogLevel::fromString(std::string_view str) {
  auto s = string_util::to_upper(string_util::trim(str));
#define XX(x)              \
  if (s == #x) {           \
    return LogLevel(L##x); \
  }

  XX(TRACE)
  XX(DEBUG)
  XX(INFO)
  XX(WARN)
  XX(ERROR)
  XX(CRITICAL)
  XX(FATAL)
  XX(CLOSE)
#undef XX
  if (s == "WARNING") return LogLevel(LWARN);

  return LogLevel(LUNKNOWN);
}

/********************************************* LogEvent
 * **********************************************/
LogEvent::LogEvent(LogLevel level, std::thread::id tid,
  const std::string &filename, int32_t line, const std::string &functionName,
  int64_t timestamp)
  : tid_(tid)
  , filename_(filename)
  , function_name_(functionName)
  , line_(line)
  , timestamp_(timestamp)
  , level_(level) {}

/***************************************** LogFormatterItem
 * ******************************************/
namespace
{
class MessageFormatterItem final : public LogFormatterItem
{
public:
  MessageFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getContent();
  }
};
class LogLevelFormatterItem final : public LogFormatterItem
{
public:
  LogLevelFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getLevel().toString();
  }
};
class LogNameFormatterItem final : public LogFormatterItem
{
public:
  LogNameFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &, const Logger &logger) override {
    os << logger.getName();
  }
};
class DateTimeFormatterItem final : public LogFormatterItem
{
public:
  DateTimeFormatterItem(const std::string &format)
    : timefmt_(format.empty() ? "%Y-%m-%d %H:%M:%S" : format) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << Time::toFormatString(event.getTimestamp(), timefmt_.c_str());
  }

private:
  std::string timefmt_;
};
class FilenameFormatterItem final : public LogFormatterItem
{
public:
  FilenameFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << string_util::basename(event.getFilename());
  }
};
class LineFormatterItem final : public LogFormatterItem
{
public:
  LineFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getLine();
  }
};
class StringFormatterItem final : public LogFormatterItem
{
public:
  StringFormatterItem(const std::string &str) : str_(str) {}
  void format(std::ostream &os, const LogEvent &, const Logger &) override {
    os << str_;
  }

private:
  std::string str_;
};
class FunctionNameFormatterItem final : public LogFormatterItem
{
public:
  FunctionNameFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getFunctionName();
  }
};
class ThreadNameFormatterItem final : public LogFormatterItem
{
public:
  ThreadNameFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getThreadName();
  }
};
class ThreadIdFormatterItem final : public LogFormatterItem
{
public:
  ThreadIdFormatterItem(const std::string &) {}
  void format(std::ostream &os, const LogEvent &event, const Logger &) override {
    os << event.getThreadId();
  }
};

enum ParseStatus
{
  PARSE_OK = 0,
  PARSE_ERROR = 1,
};

struct PatToken
{
  std::string id;
  std::string arg;
  ParseStatus status;
};

// "CHAR:x" -> {CHAR, x}, "DATETIME{fmt}" -> {DATETIME, fmt}, "ID" -> {ID}
PatToken parsePatToken(const std::string &patToken) {
  if (string_util::start_with(patToken, "CHAR:")) {
    if (patToken.length() <= 5) return {"CHAR", "", PARSE_ERROR};
    return {"CHAR", patToken.substr(5), PARSE_OK};
  }
  if (string_util::start_with(patToken, "DATETIME")) {
    if (patToken.length() == 8) {
      return {"DATETIME", "", PARSE_OK};
    }
    auto close = patToken.rfind('}');
    if (patToken[8] != '{' || close == std::string::npos || close < 9) {
      return {patToken, "", PARSE_ERROR};
    }
    return {"DATETIME", patToken.substr(9, close - 9), PARSE_OK};
  }
  return {patToken, "", PARSE_OK};
}
}  // namespace

/******************************************* LogFormatter
 * *******************************************/
LogFormatter::LogFormatter(const std::string &pattern) : pattern_(pattern) {
  init();
}

std::string LogFormatter::format(const LogEvent &event, const Logger &logger) const {
  std::stringstream ss;
  for (auto &item : items_) {
    item->format(ss, event, logger);
  }
  return ss.str();
}

std::ostream &LogFormatter::format(
  std::ostream &os, const LogEvent &event, const Logger &logger) const {
  os << format(event, logger);
  os.flush();
  return os;
}

void LogFormatter::init() {
  using ItemMaker = std::function<LogFormatterItem::ptr(const std::string &)>;
  static const std::unordered_map<std::string, ItemMaker> s_format_items = {
#define XX(STR, ID)                                            \
  {                                                            \
    STR, [](const std::string &str) -> LogFormatterItem::ptr { \
      return std::make_shared<ID>(str);                        \
    }                                                          \
  }
    XX("LOG_LEVEL", LogLevelFormatterItem),
    XX("MESSAGE", MessageFormatterItem),
    XX("LOG_NAME", LogNameFormatterItem),
    XX("DATETIME", DateTimeFormatterItem),
    XX("FILENAME", FilenameFormatterItem),
    XX("LINE", LineFormatterItem),
    XX("CHAR", StringFormatterItem),
    XX("FUNCTION_NAME", FunctionNameFormatterItem),
    XX("THREAD_NAME", ThreadNameFormatterItem),
    XX("THREAD_ID", ThreadIdFormatterItem),
#undef XX
  };

  items_.clear();
  has_error_ = false;
  error_.clear();

  auto first = pattern_.find(ID_TOKEN);
  if (first != 0) {
    // leading text before the first token is literal
    items_.push_back(std::make_shared<StringFormatterItem>(pattern_.substr(0, first)));
  }
  if (first == std::string::npos) return;

  size_t start = first + 1;
  while (start <= pattern_.size()) {
    auto next = pattern_.find(ID_TOKEN, start);
    auto token = pattern_.substr(start, next == std::string::npos ? std::string::npos : next - start);

    auto parsed = parsePatToken(token);
    auto it = s_format_items.find(parsed.id);
    if (parsed.status != PARSE_OK || it == s_format_items.end()) {
      has_error_ = true;
      error_ = "<<PATTERN ERROR: UNSUPPORTED FORMAT $" + token + ">>";
      items_.push_back(std::make_shared<StringFormatterItem>(error_));
    }
    else {
      items_.push_back(it->second(parsed.arg));
    }

    if (next == std::string::npos) break;
    start = next + 1;
  }
}

YAML::Node LogFormatter::toYaml() const {
  YAML::Node node;
  node["pattern"] = pattern_;
  return node;
}

/******************************************* LogAppender
 * *********************************************/
void LogAppender::setFormatter(LogFormatter::ptr pFormatter) {
  Mutex::lock locker(mutex_);
  formatter_ = std::move(pFormatter);
}

LogFormatter::ptr LogAppender::getFormatter() const {
  Mutex::lock locker(mutex_);
  return formatter_;
}

YAML::Node LogAppender::baseYaml(const char *type) const {
  YAML::Node node;
  node["type"] = type;
  node["level"] = level_.toString();
  if (auto formatter = getFormatter()) {
    node["formatter"] = formatter->toYaml();
  }
  return node;
}

/**************************************** StreamLogAppender
 * *****************************************/
void StreamLogAppender::log(const LogEvent &event, const Logger &logger) {
  if (event.getLevel() < level_) return;

  Mutex::lock locker(mutex_);
  if (formatter_) formatter_->format(os_, event, logger);
}

YAML::Node StreamLogAppender::toYaml() const {
  return baseYaml("StreamLogAppender");
}

/**************************************** StdoutLogAppender
 * *****************************************/
void StdoutLogAppender::log(const LogEvent &event, const Logger &logger) {
  if (event.getLevel() < level_) return;

  Mutex::lock locker(mutex_);
  if (!formatter_) return;
  auto line = formatter_->format(event, logger);
  os_ << LogColorConfig::getColor(event.getLevel()) << line
      << LogColorConfig::kEnd;
  os_.flush();
}

YAML::Node StdoutLogAppender::toYaml() const {
  return baseYaml("StdoutLogAppender");
}

/***************************************** FileLogAppender
 * *******************************************/
FileLogAppender::FileLogAppender(const std::string &dir, const std::string &filename)
  : dir_(dir), filename_(filename) {
  if (!dir_.empty() && dir_.back() != '/') dir_.push_back('/');
}

void FileLogAppender::log(const LogEvent &event, const Logger &logger) {
  if (event.getLevel() < level_) return;

  Mutex::lock locker(mutex_);
  if (!formatter_) return;
  if (!reopenIfShould(event.getTimestamp())) {
    std::cerr << "error in FileLogAppender::log, log file "
              << getWholeFilename(event.getTimestamp())
              << " cannot be opened" << std::endl;
    return;
  }

  formatter_->format(file_stream_, event, logger);
  ++lines_;
}

bool FileLogAppender::reopenIfShould(int64_t timestamp) {
  const int today =
    Time::localTime(static_cast<time_t>(timestamp / 1000)).tm_yday;
  bool should = !file_stream_.is_open();
  if (today != today_) {
    today_ = today;
    cnt_ = 0;
    lines_ = 0;
    should = true;
  }
  else if (lines_ >= kMaxFileLines) {
    ++cnt_;
    lines_ = 0;
    should = true;
  }
  if (!should) return true;

  if (file_stream_.is_open()) file_stream_.close();
  if (!dir_.empty() && !os_api::mkdir(dir_)) return false;
  file_stream_.open(getWholeFilename(timestamp), std::ios::app);
  return file_stream_.is_open();
}

std::string FileLogAppender::getWholeFilename(int64_t timestamp) const {
  return fmt::format("{}{}_{}_{:02d}.log", dir_, filename_,
    Time::toFormatString(timestamp, "%Y-%m-%d"), cnt_);
}

YAML::Node FileLogAppender::toYaml() const {
  auto node = baseYaml("FileLogAppender");
  node["filename"] = filename_;
  return node;
}

/********************************************** Logger
 * **********************************************/
Logger::Logger(const std::string &name, LogLevel level, const std::string &pattern)
  : name_(name)
  , level_(level.level())
  , formatter_(std::make_shared<LogFormatter>(pattern)) {}

void Logger::log(const LogEvent &event) {
  if (!isEnabled(event.getLevel())) return;

  std::list<LogAppender::ptr> appenders;
  Logger::ptr parent;
  {
    Mutex::lock locker(mutex_);
    appenders = appenders_;
    parent = parent_;
  }

  if (!appenders.empty()) {
    for (auto &pAppender : appenders) {
      pAppender->log(event, *this);
    }
  }
  else if (parent) {
    parent->log(event);
  }
}

void Logger::addAppender(LogAppender::ptr pAppender) {
  Mutex::lock locker(mutex_);
  if (!pAppender->getFormatter()) {
    pAppender->setFormatter(formatter_);
  }
  appenders_.push_back(std::move(pAppender));
}
void Logger::removeAppender(LogAppender::ptr pAppender) {
  Mutex::lock locker(mutex_);
  appenders_.remove(pAppender);
}
void Logger::clearAppenders() {
  Mutex::lock locker(mutex_);
  appenders_.clear();
}
std::list<LogAppender::ptr> Logger::getAppenders() const {
  Mutex::lock locker(mutex_);
  return appenders_;
}

void Logger::setFormatter(LogFormatter::ptr pFormatter) {
  Mutex::lock locker(mutex_);
  formatter_ = std::move(pFormatter);
}
void Logger::setFormatter(const std::string &pattern) {
  setFormatter(std::make_shared<LogFormatter>(pattern));
}
LogFormatter::ptr Logger::getFormatter() const {
  Mutex::lock locker(mutex_);
  return formatter_;
}

Logger::ptr Logger::getParent() const {
  Mutex::lock locker(mutex_);
  return parent_;
}
void Logger::setParent(Logger::ptr pLogger) {
  Mutex::lock locker(mutex_);
  parent_ = std::move(pLogger);
}

YAML::Node Logger::toYaml() const {
  Mutex::lock locker(mutex_);
  YAML::Node node;
  node["name"] = name_;
  node["level"] = LogLevel(level_.load()).toString();
  node["formatter"] = formatter_->toYaml();
  for (const auto &appender : appenders_) {
    node["appenders"].push_back(appender->toYaml());
  }
  if (parent_) node["parent"] = parent_->getName();
  return node;
}

/***************************************** LogEventWrapper
 * ******************************************/
LogEventWrapper::LogEventWrapper(LogEvent::ptr pEvent, Logger::ptr pLogger)
  : event_(std::move(pEvent)), logger_(std::move(pLogger)) {}

/******************************************** LogManager
 * ********************************************/
LogManager::LogManager()
  : root_(std::make_shared<Logger>("root", LogLevel::LINFO)) {
  root_->addAppender(std::make_shared<StdoutLogAppender>());
  loggers_[root_->getName()] = root_;
}

Logger::ptr LogManager::getLogger(const std::string &name) {
  Mutex::lock locker(mutex_);
  return getLoggerLocked(name);
}

Logger::ptr LogManager::getLoggerLocked(const std::string &name) {
  if (auto it = loggers_.find(name); it != loggers_.end()) {
    return it->second;
  }

  // a fresh logger has no appenders of its own and forwards to its parent
  auto pLogger = std::make_shared<Logger>(name, LogLevel::LTRACE);
  auto lastDot = name.rfind(LogIniter::kSplit);
  if (lastDot != std::string::npos && lastDot > 0) {
    pLogger->setParent(getLoggerLocked(name.substr(0, lastDot)));
  }
  else {
    pLogger->setParent(root_);
  }
  loggers_[name] = pLogger;
  return pLogger;
}

Logger::ptr LogManager::findLogger(const std::string &name) const {
  Mutex::lock locker(mutex_);
  auto it = loggers_.find(name);
  return it != loggers_.end() ? it->second : nullptr;
}

std::string LogManager::getLogDir() const {
  Mutex::lock locker(mutex_);
  return log_dir_;
}
void LogManager::setLogDir(const std::string &dir) {
  Mutex::lock locker(mutex_);
  log_dir_ = dir;
}

YAML::Node LogManager::toYaml() const {
  Mutex::lock locker(mutex_);
  YAML::Node node;
  node["log_dir"] = log_dir_;
  for (const auto &[name, pLogger] : loggers_) {
    node["logger"].push_back(pLogger->toYaml());
  }
  return node;
}

std::string LogManager::toYamlString() const {
  YAML::Emitter out;
  out << toYaml();
  return out.c_str();
}

/******************************************** LogIniter
 * *********************************************/
Logger::ptr LogIniter::reg(const std::string &name, uint8_t flags,
  LogLevel level, const std::string &pattern) {
  auto pLogger = LogManager::instance()->getLogger(name);
  pLogger->clearAppenders();
  pLogger->setLevel(level);
  pLogger->setFormatter(pattern);

  if ((flags & CONSOLE) == CONSOLE) {
    pLogger->addAppender(std::make_shared<StdoutLogAppender>());
  }
  if ((flags & SYNC_FILE) == SYNC_FILE) {
    auto firstDot = name.find(kSplit);
    pLogger->addAppender(std::make_shared<FileLogAppender>(
      LogManager::instance()->getLogDir(), name.substr(0, firstDot)));
  }
  return pLogger;
}

void LogIniter::loadYamlFile(const std::string &filename) {
  loadYamlNode(YAML::LoadFile(filename));
}

void LogIniter::loadYamlNode(const YAML::Node &node) {
  if (node["log_dir"].IsDefined()) {
    LogManager::instance()->setLogDir(node["log_dir"].as<std::string>());
  }
  if (!node["logger"].IsDefined()) return;

  for (const auto &cur : node["logger"]) {
    auto pLogger = LogManager::instance()->getLogger(cur["name"].as<std::string>());
    if (cur["level"].IsDefined()) {
      pLogger->setLevel(LogLevel::fromString(cur["level"].as<std::string>()));
    }
    if (cur["formatter"].IsDefined() && cur["formatter"]["pattern"].IsDefined()) {
      pLogger->setFormatter(cur["formatter"]["pattern"].as<std::string>());
    }
    if (cur["parent"].IsDefined() && pLogger != LOG_ROOT()) {
      pLogger->setParent(GET_LOGGER(cur["parent"].as<std::string>()));
    }

    if (!cur["appenders"].IsDefined()) continue;

    pLogger->clearAppenders();
    for (const auto &app_node : cur["appenders"]) {
      auto pAppender = parseAppender(app_node);
      if (!pAppender) {
        ILOG_WARN_FMT(LOG_ROOT(), "logger {}: unsupported appender type {}",
          pLogger->getName(), app_node["type"].as<std::string>(""));
        continue;
      }
      pLogger->addAppender(pAppender);
    }
  }
}

LogAppender::ptr LogIniter::parseAppender(const YAML::Node &node) {
  LogAppender::ptr pAppender;
  auto type = node["type"].as<std::string>("");
  if (type == "StdoutLogAppender") {
    pAppender = std::make_shared<StdoutLogAppender>();
  }
  else if (type == "FileLogAppender") {
    pAppender = std::make_shared<FileLogAppender>(
      LogManager::instance()->getLogDir(), node["filename"].as<std::string>());
  }
  else {
    return nullptr;
  }

  if (node["level"].IsDefined()) {
    pAppender->setLevel(LogLevel::fromString(node["level"].as<std::string>()));
  }
  if (node["formatter"].IsDefined() && node["formatter"]["pattern"].IsDefined()) {
    pAppender->setFormatter(std::make_shared<LogFormatter>(
      node["formatter"]["pattern"].as<std::string>()));
  }
  return pAppender;
}

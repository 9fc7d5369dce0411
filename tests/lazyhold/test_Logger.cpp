#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "lazyhold/common/Logger.hpp"
#include "lazyhold/common/OSUtil.hpp"
#include "lazyhold/common/Thread.hpp"

namespace
{
LogEvent makeEvent(LogLevel level, const std::string &message) {
  LogEvent event(level, std::this_thread::get_id(), "/src/lazyhold/Example.cpp",
    17, "run", Time::timestamp());
  event.getSS() << message;
  return event;
}

// a fresh logger that writes bare messages into a string stream
Logger::ptr streamLogger(const std::string &name, std::ostringstream &os,
  LogLevel appenderLevel = LogLevel::LTRACE) {
  auto pLogger = GET_LOGGER(name);
  pLogger->clearAppenders();
  pLogger->setLevel(LogLevel::LTRACE);
  auto pAppender = std::make_shared<StreamLogAppender>(os);
  pAppender->setLevel(appenderLevel);
  pAppender->setFormatter(std::make_shared<LogFormatter>("$LOG_LEVEL$CHAR: $MESSAGE$CHAR:\n"));
  pLogger->addAppender(pAppender);
  return pLogger;
}
}  // namespace

TEST(TestLogLevel, FromStringIsCaseInsensitive)
{
  EXPECT_EQ(LogLevel::fromString("debug"), LogLevel(LogLevel::LDEBUG));
  EXPECT_EQ(LogLevel::fromString(" Error "), LogLevel(LogLevel::LERROR));
  EXPECT_EQ(LogLevel::fromString("warning"), LogLevel(LogLevel::LWARN));
  EXPECT_EQ(LogLevel::fromString("loud"), LogLevel(LogLevel::LUNKNOWN));
  EXPECT_EQ(LogLevel(LogLevel::LCRITICAL).toString(), "CRITICAL");
  EXPECT_LT(LogLevel(LogLevel::LINFO), LogLevel(LogLevel::LWARN));
}

TEST(TestLogFormatter, RendersTokens)
{
  Logger logger("test.formatter");
  LogFormatter formatter("$LOG_NAME$CHAR:[$LOG_LEVEL$CHAR:]$CHAR: $FILENAME$CHAR::$LINE$CHAR: $FUNCTION_NAME$CHAR: $MESSAGE");
  EXPECT_FALSE(formatter.hasError());
  EXPECT_EQ(formatter.format(makeEvent(LogLevel::LWARN, "hello"), logger),
    "test.formatter[WARN] Example.cpp:17 run hello");
}

TEST(TestLogFormatter, LeadingTextIsLiteral)
{
  Logger logger("test.formatter");
  LogFormatter formatter(">> $MESSAGE");
  EXPECT_FALSE(formatter.hasError());
  EXPECT_EQ(formatter.format(makeEvent(LogLevel::LINFO, "x"), logger), ">> x");
}

TEST(TestLogFormatter, UnknownTokenIsReported)
{
  Logger logger("test.formatter");
  LogFormatter formatter("$MESSAGE$NOPE");
  EXPECT_TRUE(formatter.hasError());
  EXPECT_EQ(formatter.lastError(), "<<PATTERN ERROR: UNSUPPORTED FORMAT $NOPE>>");
  EXPECT_EQ(formatter.format(makeEvent(LogLevel::LINFO, "m"), logger),
    "m<<PATTERN ERROR: UNSUPPORTED FORMAT $NOPE>>");
}

TEST(TestLogger, AppenderFiltersByLevel)
{
  std::ostringstream os;
  auto pLogger = streamLogger("test.filter", os, LogLevel::LWARN);

  ILOG_INFO_FMT(pLogger, "dropped {}", 1);
  ILOG_WARN_FMT(pLogger, "kept {}", 2);
  ILOG_ERROR(pLogger) << "streamed " << 3;

  EXPECT_EQ(os.str(), "WARN kept 2\nERROR streamed 3\n");
}

TEST(TestLogger, LoggerLevelFiltersBeforeAppenders)
{
  std::ostringstream os;
  auto pLogger = streamLogger("test.loggerlevel", os);
  pLogger->setLevel(LogLevel::LERROR);

  ILOG_WARN_FMT(pLogger, "dropped");
  ILOG_FATAL_FMT(pLogger, "kept");

  EXPECT_EQ(os.str(), "FATAL kept\n");
}

TEST(TestLogger, ForwardsToParentWithoutAppenders)
{
  std::ostringstream os;
  streamLogger("testfwd", os);

  auto pChild = GET_LOGGER("testfwd.child.leaf");
  EXPECT_EQ(pChild->getParent()->getName(), "testfwd.child");
  EXPECT_EQ(pChild->getParent()->getParent()->getName(), "testfwd");

  ILOG_DEBUG_FMT(pChild, "from {}", "leaf");
  EXPECT_EQ(os.str(), "DEBUG from leaf\n");
}

TEST(TestLogger, PrintsThreadName)
{
  std::ostringstream os;
  auto pLogger = streamLogger("test.threadname", os);
  pLogger->getAppenders().front()->setFormatter(
    std::make_shared<LogFormatter>("$THREAD_NAME$CHAR: $MESSAGE"));

  Thread th("log-worker");
  th.dispatch([pLogger] { ILOG_INFO_FMT(pLogger, "hi"); }).get();

  EXPECT_EQ(os.str(), "log-worker hi");
}

TEST(TestLogger, FileAppenderWritesDatedFile)
{
  auto dir = ::testing::TempDir() + "lazyhold_logs/";
  auto pAppender = std::make_shared<FileLogAppender>(dir, "unit");
  pAppender->setFormatter(std::make_shared<LogFormatter>("$MESSAGE$CHAR:\n"));

  Logger logger("test.file");
  auto event = makeEvent(LogLevel::LINFO, "to file");
  pAppender->log(event, logger);

  auto path = pAppender->getWholeFilename(event.getTimestamp());
  ASSERT_TRUE(os_api::exist_file(path));

  std::ifstream ifs(path);
  std::string line, last;
  while (std::getline(ifs, line)) last = line;
  EXPECT_EQ(last, "to file");
  EXPECT_TRUE(os_api::rm(path));
}

TEST(TestLogIniter, LoadsYamlConfiguration)
{
  LogIniter::loadYamlNode(YAML::Load(R"(
logger:
  - name: testyaml.sub
    level: warn
    formatter:
      pattern: "$MESSAGE"
    appenders:
      - type: StdoutLogAppender
        level: ERROR
      - type: NoSuchAppender
)"));

  auto pLogger = LogManager::instance()->findLogger("testyaml.sub");
  ASSERT_NE(pLogger, nullptr);
  EXPECT_EQ(pLogger->getLevel(), LogLevel(LogLevel::LWARN));
  EXPECT_EQ(pLogger->getFormatter()->getPattern(), "$MESSAGE");

  auto appenders = pLogger->getAppenders();
  ASSERT_EQ(appenders.size(), 1u);
  EXPECT_EQ(appenders.front()->getLevel(), LogLevel(LogLevel::LERROR));
  EXPECT_NE(std::dynamic_pointer_cast<StdoutLogAppender>(appenders.front()), nullptr);
}

TEST(TestLogIniter, ExportedConfigurationDescribesLoggers)
{
  LogIniter::reg("testexport", LogIniterFlag::CONSOLE, LogLevel::LERROR, kBriefFormatPattern);

  auto root = YAML::Load(LogManager::instance()->toYamlString());
  ASSERT_TRUE(root["logger"].IsSequence());

  bool found = false;
  for (const auto &node : root["logger"]) {
    if (node["name"].as<std::string>() != "testexport") continue;
    found = true;
    EXPECT_EQ(node["level"].as<std::string>(), "ERROR");
    EXPECT_EQ(node["parent"].as<std::string>(), "root");
    EXPECT_EQ(node["formatter"]["pattern"].as<std::string>(), kBriefFormatPattern);
    ASSERT_EQ(node["appenders"].size(), 1u);
    EXPECT_EQ(node["appenders"][0]["type"].as<std::string>(), "StdoutLogAppender");
  }
  EXPECT_TRUE(found);
}

TEST(TestLogIniter, MissingFileThrows)
{
  EXPECT_THROW(LogIniter::loadYamlFile("/nonexistent/lazyhold/log.yml"), YAML::Exception);
}

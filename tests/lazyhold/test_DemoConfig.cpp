#include <gtest/gtest.h>

#include <stdexcept>

#include "lazyhold/DemoConfig.hpp"

TEST(TestDemoConfig, Defaults)
{
  DemoConfig config;
  EXPECT_EQ(config.callers, 100);
  EXPECT_EQ(config.construction_delay_ms, 50);
  EXPECT_EQ(config.failing_attempts, 0);
  EXPECT_TRUE(config.log_config.empty());
}

TEST(TestDemoConfig, MissingKeysKeepDefaults)
{
  auto config = DemoConfig::loadYaml(YAML::Load("callers: 8\nfailing_attempts: 2\n"));
  EXPECT_EQ(config.callers, 8);
  EXPECT_EQ(config.failing_attempts, 2);
  EXPECT_EQ(config.construction_delay_ms, 50);
}

TEST(TestDemoConfig, DumpLoadsBack)
{
  DemoConfig config;
  config.callers = 3;
  config.log_config = "config/log.yml";
  auto loaded = DemoConfig::loadYaml(YAML::Load(config.dump2YamlString()));
  EXPECT_EQ(loaded.callers, 3);
  EXPECT_EQ(loaded.log_config, "config/log.yml");
}

TEST(TestDemoConfig, RejectsOutOfRange)
{
  EXPECT_THROW(DemoConfig::loadYaml(YAML::Load("callers: 0")), std::invalid_argument);
  EXPECT_THROW(DemoConfig::loadYaml(YAML::Load("construction_delay_ms: -1")),
    std::invalid_argument);
}

TEST(TestDemoConfig, RejectsWrongType)
{
  EXPECT_THROW(DemoConfig::loadYaml(YAML::Load("callers: many")), YAML::Exception);
}

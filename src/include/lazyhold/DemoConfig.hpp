#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

struct DemoConfig
{
  int callers{100};
  int construction_delay_ms{50};
  // the first N constructions throw
  int failing_attempts{0};
  // optional logger configuration, see config/log.yml
  std::string log_config;

  YAML::Node dump2Yaml() const {
    YAML::Node root;
    root["callers"] = callers;
    root["construction_delay_ms"] = construction_delay_ms;
    root["failing_attempts"] = failing_attempts;
    if (!log_config.empty()) root["log_config"] = log_config;
    return root;
  }
  std::string dump2YamlString() const {
    YAML::Emitter out;
    out << dump2Yaml();
    return out.c_str();
  }

  /* missing keys keep their defaults; throws YAML::Exception or std::invalid_argument */
  static DemoConfig loadYaml(const YAML::Node &node) {
    DemoConfig config;
    if (node["callers"]) config.callers = node["callers"].as<int>();
    if (node["construction_delay_ms"])
      config.construction_delay_ms = node["construction_delay_ms"].as<int>();
    if (node["failing_attempts"])
      config.failing_attempts = node["failing_attempts"].as<int>();
    if (node["log_config"]) config.log_config = node["log_config"].as<std::string>();

    if (config.callers < 1) {
      throw std::invalid_argument("callers must be at least 1");
    }
    if (config.construction_delay_ms < 0 || config.failing_attempts < 0) {
      throw std::invalid_argument(
        "construction_delay_ms and failing_attempts must not be negative");
    }
    return config;
  }
  static DemoConfig loadYamlFile(const std::string &filename) {
    return loadYaml(YAML::LoadFile(filename));
  }
};

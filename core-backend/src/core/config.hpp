#pragma once

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

struct Config {
  std::string db_path;
  int api_port = 8080;
  std::optional<std::string> backend_identity;
  std::optional<uint64_t> default_operation_ttl_seconds;
  bool compensate_partial_settlement = true;
  bool log_events = true;

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key))
        throw std::runtime_error(std::string("配置文件缺少必填字段: ") + key);
      return j[key];
    };

    Config config;
    config.db_path = require("db_path").get<std::string>();
    config.api_port = require("api_port").get<int>();

    if (j.contains("backend_identity") && !j["backend_identity"].is_null())
      config.backend_identity = j["backend_identity"].get<std::string>();
    if (j.contains("default_operation_ttl_seconds") &&
        !j["default_operation_ttl_seconds"].is_null()) {
      const json &ttl = j["default_operation_ttl_seconds"];
      if (!ttl.is_number_unsigned())
        throw std::runtime_error("default_operation_ttl_seconds 必须是非负整数: " +
                                 ttl.dump());
      config.default_operation_ttl_seconds = ttl.get<uint64_t>();
    }
    config.compensate_partial_settlement =
        j.value("compensate_partial_settlement", true);
    config.log_events = j.value("log_events", true);

    if (config.api_port <= 0 || config.api_port > 65535)
      throw std::runtime_error("api_port 超出范围: " +
                               std::to_string(config.api_port));
    return config;
  }

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    f >> j;
    return from_json(j);
  }
};

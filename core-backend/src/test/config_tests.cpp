#include "../core/config.hpp"

#include <cstdio>
#include <fstream>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(minimal_config_uses_defaults) {
  Config config = Config::from_json(json::parse(R"({"db_path": ":memory:", "api_port": 9000})"));
  BOOST_CHECK_EQUAL(config.db_path, ":memory:");
  BOOST_CHECK_EQUAL(config.api_port, 9000);
  BOOST_CHECK(!config.backend_identity);
  BOOST_CHECK(!config.default_operation_ttl_seconds);
  BOOST_CHECK(config.compensate_partial_settlement);
  BOOST_CHECK(config.log_events);
}

BOOST_AUTO_TEST_CASE(optional_keys_are_read) {
  Config config = Config::from_json(json::parse(R"({
    "db_path": "wager.duckdb",
    "api_port": 8080,
    "backend_identity": "backend-signer",
    "default_operation_ttl_seconds": 86400,
    "compensate_partial_settlement": false,
    "log_events": false
  })"));
  BOOST_CHECK(config.backend_identity == std::optional<std::string>("backend-signer"));
  BOOST_CHECK(config.default_operation_ttl_seconds == std::optional<uint64_t>(86400));
  BOOST_CHECK(!config.compensate_partial_settlement);
  BOOST_CHECK(!config.log_events);
}

BOOST_AUTO_TEST_CASE(missing_required_key_names_it) {
  try {
    Config::from_json(json::parse(R"({"api_port": 8080})"));
    BOOST_ERROR("expected missing db_path to throw");
  } catch (const std::runtime_error &e) {
    BOOST_CHECK(std::string(e.what()).find("db_path") != std::string::npos);
  }
  BOOST_CHECK_THROW(Config::from_json(json::parse(R"({"db_path": "x"})")), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(port_out_of_range_is_rejected) {
  BOOST_CHECK_THROW(Config::from_json(json::parse(R"({"db_path": "x", "api_port": 0})")),
                    std::runtime_error);
  BOOST_CHECK_THROW(Config::from_json(json::parse(R"({"db_path": "x", "api_port": 70000})")),
                    std::runtime_error);
}

BOOST_AUTO_TEST_CASE(load_reads_file) {
  std::string path = "wager_core_config_test.json";
  {
    std::ofstream f(path);
    f << R"({"db_path": ":memory:", "api_port": 8181, "backend_identity": "b"})";
  }
  Config config = Config::load(path);
  std::remove(path.c_str());

  BOOST_CHECK_EQUAL(config.api_port, 8181);
  BOOST_CHECK(config.backend_identity == std::optional<std::string>("b"));
  BOOST_CHECK_THROW(Config::load("does/not/exist.json"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(default_ttl_must_be_non_negative_integer) {
  BOOST_CHECK_THROW(Config::from_json(json::parse(
                        R"({"db_path": "x", "api_port": 80, "default_operation_ttl_seconds": -1})")),
                    std::runtime_error);
  BOOST_CHECK_THROW(Config::from_json(json::parse(
                        R"({"db_path": "x", "api_port": 80, "default_operation_ttl_seconds": 1.5})")),
                    std::runtime_error);
  BOOST_CHECK_THROW(Config::from_json(json::parse(
                        R"({"db_path": "x", "api_port": 80, "default_operation_ttl_seconds": "60"})")),
                    std::runtime_error);
  Config config = Config::from_json(
      json::parse(R"({"db_path": "x", "api_port": 80, "default_operation_ttl_seconds": 0})"));
  BOOST_CHECK(config.default_operation_ttl_seconds == std::optional<uint64_t>(0));
}

BOOST_AUTO_TEST_SUITE_END()

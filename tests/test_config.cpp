/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - flat config store with format backends.
 */

#include "wq/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore defaults when empty", "[config]") {
  wq::ConfigStore store;
  REQUIRE(store.EntryCount() == 0U);
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.GetUint32("x", "y", 7U) == 7U);
  REQUIRE(store.GetPort("x", "y", 3000U) == 3000U);
  REQUIRE(store.GetBool("x", "y", true));
  REQUIRE(!store.FindInt("x", "y").has_value());
}

TEST_CASE("ConfigStore Set overwrites case-insensitively", "[config]") {
  wq::ConfigStore store;
  store.Set("Task", "Max_Retries", "3");
  store.Set("task", "max_retries", "5");
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(store.GetInt("TASK", "MAX_RETRIES", 0) == 5);
  REQUIRE(store.HasSection("task"));
  REQUIRE(store.HasKey("task", "max_retries"));
  REQUIRE(!store.HasKey("task", "retry_delay_ms"));
}

TEST_CASE("ConfigStore numeric conversions", "[config]") {
  wq::ConfigStore store;
  store.Set("n", "neg", "-4");
  store.Set("n", "text", "abc");
  store.Set("n", "big_port", "70000");
  store.Set("n", "ratio", "0.25");
  store.Set("n", "flag", "yes");

  REQUIRE(store.GetInt("n", "neg", 0) == -4);
  REQUIRE(store.GetUint32("n", "neg", 9U) == 9U);
  REQUIRE(store.GetUint32("n", "text", 9U) == 9U);
  REQUIRE(store.GetPort("n", "big_port", 1U) == 65535U);
  REQUIRE(store.GetDouble("n", "ratio", 0.0) == 0.25);
  REQUIRE(store.GetBool("n", "flag", false));
}

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef WQ_CONFIG_JSON_ENABLED

using JsonCfg = wq::Config<wq::JsonBackend>;

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  const std::string json_data = R"({
    "task": {"max_retries": 4, "retry_delay_ms": 250},
    "server": {"host": "127.0.0.1", "port": 8080},
    "log": {"level": "debug", "verbose": true},
    "name": "workq"
  })";

  JsonCfg cfg;
  auto result = cfg.LoadBuffer(json_data, wq::ConfigFormat::kJson);
  REQUIRE(result.has_value());

  REQUIRE(cfg.GetInt("task", "max_retries", 0) == 4);
  REQUIRE(cfg.GetUint32("task", "retry_delay_ms", 0U) == 250U);
  REQUIRE(std::strcmp(cfg.GetString("server", "host"), "127.0.0.1") == 0);
  REQUIRE(cfg.GetPort("server", "port", 0U) == 8080U);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "debug") == 0);
  REQUIRE(cfg.GetBool("log", "verbose", false));
  REQUIRE(std::strcmp(cfg.GetString("", "name"), "workq") == 0);
}

TEST_CASE("JSON malformed buffer", "[config][json]") {
  JsonCfg cfg;
  auto result = cfg.LoadBuffer("{\"task\": ", wq::ConfigFormat::kJson);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == wq::ConfigError::kParseError);

  auto arr = cfg.LoadBuffer("[1, 2, 3]", wq::ConfigFormat::kJson);
  REQUIRE(!arr.has_value());
  REQUIRE(arr.get_error() == wq::ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile and missing file", "[config][json]") {
  const char* path = "/tmp/wq_test_config.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fputs("{\"worker\": {\"idle_timeout_ms\": 1500}}", f);
  std::fclose(f);

  JsonCfg cfg;
  auto result = cfg.LoadFile(path);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetUint32("worker", "idle_timeout_ms", 0U) == 1500U);
  std::remove(path);

  auto missing = cfg.LoadFile("/tmp/wq_definitely_missing.json");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == wq::ConfigError::kFileNotFound);
}

TEST_CASE("MultiConfig rejects formats compiled out", "[config][json]") {
  wq::MultiConfig cfg;
#ifndef WQ_CONFIG_YAML_ENABLED
  auto r = cfg.LoadBuffer("task:\n  max_retries: 2\n", wq::ConfigFormat::kYaml);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == wq::ConfigError::kFormatNotSupported);
#endif
  auto ok = cfg.LoadBuffer("{\"task\": {\"max_retries\": 2}}",
                           wq::ConfigFormat::kJson);
  REQUIRE(ok.has_value());
}

#endif  // WQ_CONFIG_JSON_ENABLED

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef WQ_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer basic", "[config][ini]") {
  const std::string ini_data =
      "[server]\n"
      "port = 5090\n"
      "host = 0.0.0.0\n"
      "[log]\n"
      "level = INFO\n";

  wq::IniConfig cfg;
  auto result = cfg.LoadBuffer(ini_data, wq::ConfigFormat::kIni);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetPort("server", "port", 0U) == 5090U);
  REQUIRE(std::strcmp(cfg.GetString("server", "host"), "0.0.0.0") == 0);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "INFO") == 0);
}

#endif  // WQ_CONFIG_INI_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef WQ_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer basic", "[config][yaml]") {
  const std::string yaml_data =
      "task:\n"
      "  max_retries: 5\n"
      "worker:\n"
      "  max_workers: 2\n";

  wq::YamlConfig cfg;
  auto result = cfg.LoadBuffer(yaml_data, wq::ConfigFormat::kYaml);
  REQUIRE(result.has_value());
  REQUIRE(cfg.GetInt("task", "max_retries", 0) == 5);
  REQUIRE(cfg.GetUint32("worker", "max_workers", 0U) == 2U);
}

#endif  // WQ_CONFIG_YAML_ENABLED

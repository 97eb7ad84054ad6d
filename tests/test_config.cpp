/**
 * @file test_config.cpp
 * @brief Tests for the launcher config Loader: defaults, JSON, environment.
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

#include "ignite/config/config_loader.hpp"
#include "ignite/config/constants.hpp"

using ignite::config::ConfigError;
using ignite::config::LauncherConfig;
using ignite::config::Loader;
using ignite::config::RunnerKind;
namespace constants = ignite::config::constants;

///
/// Helper: sets an environment variable for the lifetime of the object.
///
class ScopedEnv {
public:
  ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~ScopedEnv() { ::unsetenv(name_); }
  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
  const char* name_;
};

// --------------------------------- Defaults --------------------------------

/**
 * @test Empty_Path_Yields_Defaults
 */
TEST(ConfigLoader, Empty_Path_Yields_Defaults) {
  auto cfg = Loader::load_from_file("");
  ASSERT_TRUE(cfg.has_value());

  EXPECT_TRUE(cfg->service_name.empty());
  EXPECT_EQ(cfg->host, constants::LAUNCH_DEFAULT_HOST);
  EXPECT_FALSE(cfg->port.has_value());
  EXPECT_EQ(cfg->log_level, "info");
  EXPECT_FALSE(cfg->console.width.has_value());
  EXPECT_FALSE(cfg->registry.enabled);
  EXPECT_EQ(cfg->registry.address, constants::REGISTRY_REGISTER_ADDRESS);
  EXPECT_EQ(cfg->registry.check_interval, "30s");
  EXPECT_EQ(cfg->registry.check_timeout, "3s");
  EXPECT_FALSE(cfg->tracing.enabled);
  EXPECT_EQ(cfg->runner.kind, RunnerKind::Http);
  EXPECT_EQ(cfg->runner.health_path, "/health");
  EXPECT_EQ(cfg->runner.workers, 1);
}

// ----------------------------------- JSON ----------------------------------

/**
 * @test Json_Overrides_Defaults
 */
TEST(ConfigLoader, Json_Overrides_Defaults) {
  auto cfg = Loader::load_from_string(R"({
    "service_name": "billing",
    "host": "10.0.0.5",
    "port": 8081,
    "log_level": "debug",
    "console": {"width": 60},
    "registry": {"enabled": true, "address": "http://consul:8500/v1/agent/service/register",
                 "check_path": "/hc", "check_interval": "10s"},
    "tracing": {"enabled": true},
    "runner": {"kind": "command", "program": "uvicorn", "app_path": "billing.main:app", "workers": 4}
  })");
  ASSERT_TRUE(cfg.has_value()) << cfg.error().detail;

  EXPECT_EQ(cfg->service_name, "billing");
  EXPECT_EQ(cfg->host, "10.0.0.5");
  EXPECT_EQ(cfg->port, std::optional<std::uint16_t>(8081));
  EXPECT_EQ(cfg->log_level, "debug");
  EXPECT_EQ(cfg->console.width, std::optional<int>(60));
  EXPECT_TRUE(cfg->registry.enabled);
  EXPECT_EQ(cfg->registry.address, "http://consul:8500/v1/agent/service/register");
  EXPECT_EQ(cfg->registry.pass_address, constants::REGISTRY_PASS_ADDRESS);
  EXPECT_EQ(cfg->registry.check_path, "/hc");
  EXPECT_EQ(cfg->registry.check_interval, "10s");
  EXPECT_EQ(cfg->registry.check_timeout, "3s");
  EXPECT_TRUE(cfg->tracing.enabled);
  EXPECT_EQ(cfg->runner.kind, RunnerKind::Command);
  EXPECT_EQ(cfg->runner.program, "uvicorn");
  EXPECT_EQ(cfg->runner.app_path, "billing.main:app");
  EXPECT_EQ(cfg->runner.workers, 4);
}

/**
 * @test Null_Values_Keep_Defaults
 */
TEST(ConfigLoader, Null_Values_Keep_Defaults) {
  auto cfg = Loader::load_from_string(R"({"host": null, "port": null})");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->host, constants::LAUNCH_DEFAULT_HOST);
  EXPECT_FALSE(cfg->port.has_value());
}

/**
 * @test Malformed_Json_Is_Reported
 */
TEST(ConfigLoader, Malformed_Json_Is_Reported) {
  auto cfg = Loader::load_from_string("{ not json");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigError::Malformed);

  auto arr = Loader::load_from_string("[1, 2]");
  ASSERT_FALSE(arr.has_value());
  EXPECT_EQ(arr.error().code, ConfigError::Malformed);
}

/**
 * @test Wrong_Type_Is_Malformed
 */
TEST(ConfigLoader, Wrong_Type_Is_Malformed) {
  auto cfg = Loader::load_from_string(R"({"port": "eighty"})");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigError::Malformed);
}

/**
 * @test Semantic_Errors_Are_Invalid
 */
TEST(ConfigLoader, Semantic_Errors_Are_Invalid) {
  auto port = Loader::load_from_string(R"({"port": 70000})");
  ASSERT_FALSE(port.has_value());
  EXPECT_EQ(port.error().code, ConfigError::Invalid);

  auto kind = Loader::load_from_string(R"({"runner": {"kind": "daemon"}})");
  ASSERT_FALSE(kind.has_value());
  EXPECT_EQ(kind.error().code, ConfigError::Invalid);
  EXPECT_NE(kind.error().detail.find("daemon"), std::string::npos);

  auto workers = Loader::load_from_string(R"({"runner": {"workers": 0}})");
  ASSERT_FALSE(workers.has_value());
  EXPECT_EQ(workers.error().code, ConfigError::Invalid);
}

/**
 * @test Missing_File_Is_Unreadable
 */
TEST(ConfigLoader, Missing_File_Is_Unreadable) {
  auto cfg = Loader::load_from_file("/nonexistent/ignite/launcher.json");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigError::Unreadable);
}

/**
 * @test File_Is_Parsed
 */
TEST(ConfigLoader, File_Is_Parsed) {
  const std::string path = testing::TempDir() + "ignite_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"service_name": "from-file", "port": 0})";
  }
  auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->service_name, "from-file");
  EXPECT_EQ(cfg->port, std::optional<std::uint16_t>(0));
}

// -------------------------------- Environment ------------------------------

/**
 * @test Env_Overrides_Json
 */
TEST(ConfigLoader, Env_Overrides_Json) {
  auto cfg = Loader::load_from_string(R"({"service_name": "json", "port": 1000})");
  ASSERT_TRUE(cfg.has_value());

  ScopedEnv name("IGNITE_SERVICE_NAME", "env-svc");
  ScopedEnv port("IGNITE_PORT", "9090");
  ScopedEnv width("IGNITE_CONSOLE_WIDTH", "72");
  ScopedEnv level("IGNITE_LOG_LEVEL", "warn");

  auto applied = Loader::apply_env(*cfg);
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(cfg->service_name, "env-svc");
  EXPECT_EQ(cfg->port, std::optional<std::uint16_t>(9090));
  EXPECT_EQ(cfg->console.width, std::optional<int>(72));
  EXPECT_EQ(cfg->log_level, "warn");
}

/**
 * @test Unset_Env_Leaves_Config
 */
TEST(ConfigLoader, Unset_Env_Leaves_Config) {
  ::unsetenv("IGNITE_HOST");
  LauncherConfig cfg;
  cfg.host = "192.0.2.1";
  ASSERT_TRUE(Loader::apply_env(cfg).has_value());
  EXPECT_EQ(cfg.host, "192.0.2.1");
}

/**
 * @test Bad_Env_Values_Are_Invalid
 */
TEST(ConfigLoader, Bad_Env_Values_Are_Invalid) {
  {
    ScopedEnv port("IGNITE_PORT", "http");
    LauncherConfig cfg;
    auto applied = Loader::apply_env(cfg);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().code, ConfigError::Invalid);
  }
  {
    ScopedEnv width("IGNITE_CONSOLE_WIDTH", "-3");
    LauncherConfig cfg;
    auto applied = Loader::apply_env(cfg);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().code, ConfigError::Invalid);
  }
}

/**
 * @file test_config.cpp
 * @brief Tests for the JSON configuration Loader.
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "vigil/config/config_loader.hpp"

using namespace std::chrono_literals;
using vigil::alerts::Comparator;
using vigil::alerts::RuleStatistic;
using vigil::alerts::Severity;
using vigil::config::ConfigError;
using vigil::config::Loader;
using vigil::config::MonitorConfig;

/**
 * @test EmptyDocument_KeepsDefaults
 */
TEST(ConfigLoader, EmptyDocument_KeepsDefaults) {
  auto cfg = Loader::load_from_string("{}");
  ASSERT_TRUE(cfg);
  const MonitorConfig def;
  EXPECT_EQ(cfg->executions.retention, def.executions.retention);
  EXPECT_EQ(cfg->executions.max_retained, def.executions.max_retained);
  EXPECT_EQ(cfg->alert_window, def.alert_window);
  EXPECT_EQ(cfg->rules, def.rules);
  EXPECT_EQ(cfg->rules.size(), 4u);
}

/**
 * @test FullDocument_Overrides
 */
TEST(ConfigLoader, FullDocument_Overrides) {
  auto cfg = Loader::load_from_string(R"({
    "executions": { "retention_s": 120, "max_retained": 50, "stale_after_s": 600, "sweep_interval_s": 5 },
    "alert_window_s": 900,
    "timer_reservoir_size": 64,
    "record_call_metrics": false,
    "log_level": "debug",
    "rules": [
      { "name": "slow", "metric": "agent_response_time_ms", "comparator": ">", "threshold": 2500,
        "severity": "critical", "statistic": "window_max", "window_s": 60 }
    ]
  })");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->executions.retention, 120s);
  EXPECT_EQ(cfg->executions.max_retained, 50u);
  EXPECT_EQ(cfg->executions.stale_after, 600s);
  EXPECT_EQ(cfg->executions.sweep_interval, 5s);
  EXPECT_EQ(cfg->alert_window, 900s);
  EXPECT_EQ(cfg->timer_reservoir_size, 64u);
  EXPECT_FALSE(cfg->record_call_metrics);
  EXPECT_EQ(cfg->log_level, "debug");

  ASSERT_EQ(cfg->rules.size(), 1u);
  const auto& r = cfg->rules[0];
  EXPECT_EQ(r.name, "slow");
  EXPECT_EQ(r.metric_name, "agent_response_time_ms");
  EXPECT_EQ(r.comparator, Comparator::Greater);
  EXPECT_DOUBLE_EQ(r.threshold, 2500.0);
  EXPECT_EQ(r.severity, Severity::Critical);
  EXPECT_EQ(r.statistic, RuleStatistic::WindowMax);
  EXPECT_EQ(r.window, 60s);
}

/**
 * @test Rule_MetricDefaultsToName
 */
TEST(ConfigLoader, Rule_MetricDefaultsToName) {
  auto cfg = Loader::load_from_string(R"({"rules": [{"name": "agent_execution_error", "threshold": 1}]})");
  ASSERT_TRUE(cfg);
  ASSERT_EQ(cfg->rules.size(), 1u);
  EXPECT_EQ(cfg->rules[0].metric_name, "agent_execution_error");
  EXPECT_EQ(cfg->rules[0].comparator, Comparator::GreaterEqual);
  EXPECT_EQ(cfg->rules[0].statistic, RuleStatistic::WindowSum);
}

/**
 * @test Errors_AreClassified
 */
TEST(ConfigLoader, Errors_AreClassified) {
  EXPECT_EQ(Loader::load_from_string("{not json").error(), ConfigError::ParseError);
  EXPECT_EQ(Loader::load_from_string("[1,2]").error(), ConfigError::ParseError);
  EXPECT_EQ(Loader::load_from_string(R"({"alert_window_s": "soon"})").error(), ConfigError::InvalidValue);
  EXPECT_EQ(Loader::load_from_string(R"({"executions": {"retention_s": 0}})").error(), ConfigError::InvalidValue);
  EXPECT_EQ(Loader::load_from_string(R"({"log_level": "loud"})").error(), ConfigError::InvalidValue);
  EXPECT_EQ(Loader::load_from_string(R"({"rules": [{"name": "x"}]})").error(), ConfigError::InvalidValue);
  EXPECT_EQ(Loader::load_from_string(R"({"rules": [{"name": "x", "threshold": 1, "severity": "fatal"}]})").error(),
            ConfigError::InvalidValue);
  EXPECT_EQ(Loader::load_from_string(R"({"rules": {}})").error(), ConfigError::InvalidValue);
}

/**
 * @test File_LoadsAndReportsMissing
 */
TEST(ConfigLoader, File_LoadsAndReportsMissing) {
  const auto path = std::filesystem::temp_directory_path() / "vigil_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"alert_window_s": 42})";
  }
  auto cfg = Loader::load_from_file(path.string());
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->alert_window, 42s);
  std::filesystem::remove(path);

  EXPECT_EQ(Loader::load_from_file(path.string()).error(), ConfigError::FileNotFound);
}

/**
 * @file test_health.cpp
 * @brief Tests for HealthReporter classification and snapshot composition.
 */

#include <gtest/gtest.h>
#include <memory>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "vigil/config/monitor_config.hpp"
#include "vigil/health/health_reporter.hpp"
#include "vigil/util/clock.hpp"

using namespace std::chrono_literals;
using vigil::alerts::Alert;
using vigil::alerts::Severity;
using vigil::exec::ExecutionStatus;
using vigil::health::HealthReporter;
using vigil::health::HealthStatus;
using vigil::metrics::MetricKind;

namespace {

/// Components wired with the default rule set.
struct Stack {
  Stack()
      : diag(std::make_shared<spdlog::logger>("test_health", std::make_shared<spdlog::sinks::null_sink_mt>())),
        engine(clock, diag, vigil::config::default_rules()),
        store(clock, &engine),
        tracker(clock, diag),
        reporter(store, tracker, engine, 3600s) {}

  vigil::util::ManualClock clock;
  vigil::obs::Diagnostics diag;
  vigil::alerts::AlertEngine engine;
  vigil::metrics::MetricStore store;
  vigil::exec::ExecutionTracker tracker;
  HealthReporter reporter;
};

Alert alert_with(Severity s) {
  Alert a;
  a.severity = s;
  return a;
}

} // namespace

/**
 * @test Classify_BySeverity
 */
TEST(HealthReporter, Classify_BySeverity) {
  EXPECT_EQ(HealthReporter::classify({}), HealthStatus::Healthy);
  EXPECT_EQ(HealthReporter::classify({alert_with(Severity::Info)}), HealthStatus::Degraded);
  EXPECT_EQ(HealthReporter::classify({alert_with(Severity::Warning), alert_with(Severity::Info)}),
            HealthStatus::Degraded);
  EXPECT_EQ(HealthReporter::classify({alert_with(Severity::Warning), alert_with(Severity::Critical)}),
            HealthStatus::Error);
}

/**
 * @test Snapshot_HealthyWhenQuiet
 */
TEST(HealthReporter, Snapshot_HealthyWhenQuiet) {
  Stack s;
  ASSERT_TRUE(s.tracker.start("e1", {}));
  ASSERT_TRUE(s.tracker.start("e2", {}));
  s.tracker.end("e2", ExecutionStatus::Completed);
  ASSERT_TRUE(s.store.record("agent_response_time_ms", 120, {}, MetricKind::Timer));

  const auto snap = s.reporter.snapshot();
  EXPECT_EQ(snap.status, HealthStatus::Healthy);
  EXPECT_EQ(snap.executions.running, 1u);
  EXPECT_EQ(snap.executions.completed, 1u);
  EXPECT_TRUE(snap.active_alerts.empty());
  ASSERT_EQ(snap.metrics.count("agent_response_time_ms"), 1u);
}

/**
 * @test Snapshot_DegradedOnWarning_ErrorOnCritical
 */
TEST(HealthReporter, Snapshot_DegradedOnWarning_ErrorOnCritical) {
  Stack s;
  ASSERT_TRUE(s.store.record("agent_execution_error", 1, {}, MetricKind::Counter));
  EXPECT_EQ(s.reporter.snapshot().status, HealthStatus::Degraded);

  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(s.store.record("error_by_category", 1, {{"category", "llm"}}, MetricKind::Counter));
  }
  const auto snap = s.reporter.snapshot();
  EXPECT_EQ(snap.status, HealthStatus::Error);
  ASSERT_EQ(snap.active_alerts.size(), 2u);
  EXPECT_EQ(snap.active_alerts.front().rule_name, "error_burst");
}

/**
 * @test Snapshot_ReadsAreIdempotent
 * @brief Two reads with no writes in between are equal and change nothing.
 */
TEST(HealthReporter, Snapshot_ReadsAreIdempotent) {
  Stack s;
  ASSERT_TRUE(s.tracker.start("e1", {}));
  ASSERT_TRUE(s.store.record("agent_execution_error", 1, {}, MetricKind::Counter));

  const auto a = s.reporter.snapshot();
  s.clock.advance(1s);
  const auto b = s.reporter.snapshot();
  EXPECT_EQ(a, b);
  EXPECT_EQ(s.engine.history().size(), 1u);
  EXPECT_EQ(s.store.size(), 1u);
}

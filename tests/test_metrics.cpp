/**
 * @file test_metrics.cpp
 * @brief Tests for MetricStore aggregation, key identity and concurrent updates.
 *
 * Validates:
 *  - Counter / timer / gauge aggregates and headline values
 *  - Canonical key = name + sorted labels
 *  - KindMismatch and InvalidArgument rejections
 *  - No lost updates under many concurrent writers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

#include "vigil/metrics/metric_store.hpp"
#include "vigil/util/clock.hpp"

using namespace std::chrono_literals;
using vigil::metrics::Labels;
using vigil::metrics::MetricKind;
using vigil::metrics::MetricStore;
using vigil::obs::ObsErr;
using vigil::util::ManualClock;

namespace {

/// Records every observation handed to it.
struct RecordingObserver final : vigil::metrics::MetricObserver {
  std::vector<std::string> names;
  std::vector<std::string> keys;
  std::vector<double> aggregate_values;
  std::vector<uint64_t> seqs;
  void on_metric(const vigil::metrics::Observation& o) override {
    names.emplace_back(o.name);
    keys.emplace_back(o.key);
    seqs.push_back(o.seq);
    aggregate_values.push_back(o.aggregate.value);
  }
};

} // namespace

// --------------------------- Keys ------------------------------------------

/**
 * @test CanonicalKey_SortsLabels
 * @brief Label order never changes the key; no labels means bare name.
 */
TEST(MetricStore, CanonicalKey_SortsLabels) {
  EXPECT_EQ(vigil::metrics::canonical_key("m", {}), "m");
  EXPECT_EQ(vigil::metrics::canonical_key("m", Labels{{"b", "2"}, {"a", "1"}}), "m{a=1,b=2}");
}

/**
 * @test CanonicalKey_EscapesDelimiters
 * @brief Delimiters inside names, label keys and label values are backslash-escaped.
 */
TEST(MetricStore, CanonicalKey_EscapesDelimiters) {
  using vigil::metrics::canonical_key;
  EXPECT_EQ(canonical_key("req", Labels{{"a", "x,b=y"}}), R"(req{a=x\,b\=y})");
  EXPECT_EQ(canonical_key("m{a=b}", {}), R"(m\{a\=b\})");
  EXPECT_EQ(canonical_key("p\\q", Labels{{"k}", "v"}}), R"(p\\q{k\}=v})");
  EXPECT_NE(canonical_key("req", Labels{{"a", "x,b=y"}}),
            canonical_key("req", Labels{{"a", "x"}, {"b", "y"}}));
  EXPECT_NE(canonical_key("m{a=b}", {}), canonical_key("m", Labels{{"a", "b"}}));
}

/**
 * @test LookalikeKeys_StayDistinct
 * @brief Pairs whose unescaped text would collide keep separate aggregates and names.
 */
TEST(MetricStore, LookalikeKeys_StayDistinct) {
  ManualClock clock;
  RecordingObserver obs;
  MetricStore store(clock, &obs);

  ASSERT_TRUE(store.record("req", 1, {{"a", "x,b=y"}}, MetricKind::Counter));
  ASSERT_TRUE(store.record("req", 5, {{"a", "x"}, {"b", "y"}}, MetricKind::Counter));
  EXPECT_EQ(store.size(), 2u);
  auto two = store.find("req", {{"a", "x"}, {"b", "y"}});
  ASSERT_TRUE(two);
  EXPECT_DOUBLE_EQ(two->sum, 5.0);

  ASSERT_TRUE(store.record("m{a=b}", 1, {}, MetricKind::Gauge));
  ASSERT_TRUE(store.record("m", 2, {{"a", "b"}}, MetricKind::Counter)); // no KindMismatch
  auto m = store.find("m", {{"a", "b"}});
  ASSERT_TRUE(m);
  EXPECT_EQ(m->name, "m");
  EXPECT_EQ(m->kind, MetricKind::Counter);
  EXPECT_EQ(store.size(), 4u);
  EXPECT_EQ(obs.names.back(), "m");
}

/**
 * @test Labels_SeparateSeries
 * @brief Same name with different labels aggregates independently.
 */
TEST(MetricStore, Labels_SeparateSeries) {
  ManualClock clock;
  MetricStore store(clock);

  ASSERT_TRUE(store.record("error_by_category", 1, {{"category", "tts"}}, MetricKind::Counter));
  ASSERT_TRUE(store.record("error_by_category", 2, {{"category", "llm"}}, MetricKind::Counter));
  ASSERT_TRUE(store.record("error_by_category", 3, {{"category", "tts"}}, MetricKind::Counter));

  EXPECT_EQ(store.size(), 2u);
  auto tts = store.find("error_by_category", {{"category", "tts"}});
  ASSERT_TRUE(tts);
  EXPECT_DOUBLE_EQ(tts->value, 4.0);
  EXPECT_EQ(tts->count, 2u);
  EXPECT_FALSE(store.find("error_by_category", {}).has_value());
}

// --------------------------- Aggregates ------------------------------------

/**
 * @test Counter_SumsIncrements
 */
TEST(MetricStore, Counter_SumsIncrements) {
  ManualClock clock;
  MetricStore store(clock);

  ASSERT_TRUE(store.record("requests", 1, {}, MetricKind::Counter));
  clock.advance(5s);
  ASSERT_TRUE(store.record("requests", 2.5, {}, MetricKind::Counter));

  auto s = store.find("requests", {});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->kind, MetricKind::Counter);
  EXPECT_EQ(s->count, 2u);
  EXPECT_DOUBLE_EQ(s->sum, 3.5);
  EXPECT_DOUBLE_EQ(s->value, 3.5);
  EXPECT_DOUBLE_EQ(s->min, 1.0);
  EXPECT_DOUBLE_EQ(s->max, 2.5);
  EXPECT_DOUBLE_EQ(s->last, 2.5);
  EXPECT_EQ(s->last_updated, clock.now());
}

/**
 * @test Timer_MeanAndPercentiles
 * @brief 1..100 ms gives mean 50.5 and nearest-rank p50/p95/p99.
 */
TEST(MetricStore, Timer_MeanAndPercentiles) {
  ManualClock clock;
  MetricStore store(clock);

  for (int i = 100; i >= 1; --i) {
    ASSERT_TRUE(store.record("agent_response_time_ms", i, {}, MetricKind::Timer));
  }
  auto s = store.find("agent_response_time_ms", {});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->count, 100u);
  EXPECT_DOUBLE_EQ(s->value, 50.5);
  EXPECT_DOUBLE_EQ(s->min, 1.0);
  EXPECT_DOUBLE_EQ(s->max, 100.0);
  EXPECT_DOUBLE_EQ(s->p50, 50.0);
  EXPECT_DOUBLE_EQ(s->p95, 95.0);
  EXPECT_DOUBLE_EQ(s->p99, 99.0);
}

/**
 * @test Timer_ReservoirKeepsRecentSamples
 * @brief Percentiles reflect only the last `reservoir_size` samples; count/sum stay exact.
 */
TEST(MetricStore, Timer_ReservoirKeepsRecentSamples) {
  ManualClock clock;
  MetricStore store(clock, nullptr, /*reservoir_size=*/4);

  for (int i = 0; i < 10; ++i) ASSERT_TRUE(store.record("t", 1000, {}, MetricKind::Timer));
  for (int i = 0; i < 4; ++i)  ASSERT_TRUE(store.record("t", 1, {}, MetricKind::Timer));

  auto s = store.find("t", {});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->count, 14u);
  EXPECT_DOUBLE_EQ(s->sum, 10004.0);
  EXPECT_DOUBLE_EQ(s->p99, 1.0);
  EXPECT_DOUBLE_EQ(s->max, 1000.0);
}

/**
 * @test Gauge_LastValueWins
 * @brief Gauges accept negatives; value == last written.
 */
TEST(MetricStore, Gauge_LastValueWins) {
  ManualClock clock;
  MetricStore store(clock);

  ASSERT_TRUE(store.record("queue_depth", 7, {}, MetricKind::Gauge));
  ASSERT_TRUE(store.record("queue_depth", -2, {}, MetricKind::Gauge));

  auto s = store.find("queue_depth", {});
  ASSERT_TRUE(s);
  EXPECT_DOUBLE_EQ(s->value, -2.0);
  EXPECT_DOUBLE_EQ(s->min, -2.0);
  EXPECT_DOUBLE_EQ(s->max, 7.0);
  EXPECT_EQ(s->count, 2u);
}

// --------------------------- Rejections ------------------------------------

/**
 * @test KindMismatch_Rejected
 * @brief A key keeps the kind it was created with; the aggregate is untouched.
 */
TEST(MetricStore, KindMismatch_Rejected) {
  ManualClock clock;
  MetricStore store(clock);

  ASSERT_TRUE(store.record("latency", 10, {}, MetricKind::Timer));
  auto st = store.record("latency", 1, {}, MetricKind::Counter);
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(), ObsErr::KindMismatch);

  auto s = store.find("latency", {});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->count, 1u);
  EXPECT_EQ(s->kind, MetricKind::Timer);
}

/**
 * @test InvalidArgument_Rejected
 * @brief Empty name, NaN/inf and negative counter/timer values create no series.
 */
TEST(MetricStore, InvalidArgument_Rejected) {
  ManualClock clock;
  MetricStore store(clock);

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_EQ(store.record("", 1, {}, MetricKind::Counter).error(), ObsErr::InvalidArgument);
  EXPECT_EQ(store.record("c", nan, {}, MetricKind::Counter).error(), ObsErr::InvalidArgument);
  EXPECT_EQ(store.record("g", inf, {}, MetricKind::Gauge).error(), ObsErr::InvalidArgument);
  EXPECT_EQ(store.record("c", -1, {}, MetricKind::Counter).error(), ObsErr::InvalidArgument);
  EXPECT_EQ(store.record("t", -1, {}, MetricKind::Timer).error(), ObsErr::InvalidArgument);
  EXPECT_EQ(store.size(), 0u);
}

// --------------------------- Observer / summary ----------------------------

/**
 * @test Observer_SeesAggregateAfterEachRecord
 */
TEST(MetricStore, Observer_SeesAggregateAfterEachRecord) {
  ManualClock clock;
  RecordingObserver obs;
  MetricStore store(clock, &obs);

  ASSERT_TRUE(store.record("c", 2, {{"k", "v"}}, MetricKind::Counter));
  ASSERT_TRUE(store.record("c", 3, {{"k", "v"}}, MetricKind::Counter));
  (void)store.record("c", 1, {{"k", "v"}}, MetricKind::Gauge); // rejected: not observed

  ASSERT_EQ(obs.keys.size(), 2u);
  EXPECT_EQ(obs.keys[0], "c{k=v}");
  EXPECT_LT(obs.seqs[0], obs.seqs[1]);
  EXPECT_DOUBLE_EQ(obs.aggregate_values[0], 2.0);
  EXPECT_DOUBLE_EQ(obs.aggregate_values[1], 5.0);
}

/**
 * @test Summary_ContainsEveryKey
 */
TEST(MetricStore, Summary_ContainsEveryKey) {
  ManualClock clock;
  MetricStore store(clock);

  ASSERT_TRUE(store.record("a", 1, {}, MetricKind::Counter));
  ASSERT_TRUE(store.record("b", 5, {}, MetricKind::Timer));
  ASSERT_TRUE(store.record("c", 9, {{"x", "y"}}, MetricKind::Gauge));

  const auto sum = store.summary();
  ASSERT_EQ(sum.size(), 3u);
  EXPECT_EQ(sum.at("a").kind, MetricKind::Counter);
  EXPECT_EQ(sum.at("b").kind, MetricKind::Timer);
  EXPECT_EQ(sum.at("c{x=y}").labels, (Labels{{"x", "y"}}));
  EXPECT_EQ(sum, store.summary());
}

// --------------------------- Concurrency -----------------------------------

/**
 * @test Concurrent_CounterHasNoLostUpdates
 * @brief 8 writers × 10k increments on shared and per-thread keys, with a reader polling summary().
 */
TEST(MetricStore, Concurrent_CounterHasNoLostUpdates) {
  ManualClock clock;
  MetricStore store(clock);

  constexpr int kThreads = 8;
  constexpr int kIters = 10'000;
  std::atomic<bool> done{false};

  std::thread reader([&] {
    while (!done.load(std::memory_order_acquire)) {
      auto s = store.summary();
      if (auto it = s.find("shared"); it != s.end()) {
        ASSERT_LE(it->second.value, double(kThreads * kIters));
      }
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      const Labels own{{"thread", std::to_string(t)}};
      for (int i = 0; i < kIters; ++i) {
        ASSERT_TRUE(store.record("shared", 1, {}, MetricKind::Counter));
        ASSERT_TRUE(store.record("per_thread", 1, own, MetricKind::Counter));
      }
    });
  }
  for (auto& w : writers) w.join();
  done.store(true, std::memory_order_release);
  reader.join();

  auto shared = store.find("shared", {});
  ASSERT_TRUE(shared);
  EXPECT_DOUBLE_EQ(shared->value, double(kThreads * kIters));
  EXPECT_EQ(shared->count, uint64_t(kThreads * kIters));
  for (int t = 0; t < kThreads; ++t) {
    auto s = store.find("per_thread", {{"thread", std::to_string(t)}});
    ASSERT_TRUE(s);
    EXPECT_DOUBLE_EQ(s->value, double(kIters));
  }
  EXPECT_EQ(store.size(), std::size_t(kThreads + 1));
}

#pragma once
/**
 * @file metric_types.hpp
 * @brief Metric identity, aggregate snapshots and the observation hand-off interface.
 */

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "vigil/util/clock.hpp"

namespace vigil::metrics {

/**
 * @enum MetricKind
 * @brief Aggregation applied to a metric key. Fixed for the key's lifetime.
 */
enum class MetricKind : std::uint8_t {
    Counter = 0, ///< Monotonic sum of non-negative increments
    Timer,       ///< Duration samples in milliseconds
    Gauge        ///< Last written value
};

std::string_view to_string(MetricKind k) noexcept;

/// Label set; ordered so the canonical key is deterministic.
using Labels = std::map<std::string, std::string>;

/**
 * @brief Canonical text key: `name{k1=v1,k2=v2}`, or `name` without labels.
 * @details `\\`, `,`, `=`, `{` and `}` inside the name, label keys and label
 *          values are escaped with a backslash, so the mapping is injective.
 */
std::string canonical_key(std::string_view name, const Labels& labels);

/**
 * @struct MetricSnapshot
 * @brief Point-in-time copy of one metric's aggregate.
 *
 * `value` is the headline number for the kind: sum for counters, mean for
 * timers, last written value for gauges. Percentiles are only populated for
 * timers (from the bounded reservoir of recent samples).
 */
struct MetricSnapshot {
    std::string name;                 ///< Metric name without labels
    Labels      labels;               ///< Label set
    MetricKind  kind{MetricKind::Counter};
    uint64_t    count{0};             ///< Number of record calls
    double      sum{0.0};             ///< Sum of recorded values
    double      min{0.0};             ///< Smallest recorded value
    double      max{0.0};             ///< Largest recorded value
    double      last{0.0};            ///< Most recent recorded value
    double      value{0.0};           ///< Headline value (see above)
    double      p50{0.0};
    double      p95{0.0};
    double      p99{0.0};
    util::Timestamp last_updated{};   ///< Time of the most recent record

    bool operator==(const MetricSnapshot&) const = default;
};

/// Canonical key → aggregate, ordered for stable iteration.
using MetricsSummary = std::map<std::string, MetricSnapshot>;

/**
 * @struct Observation
 * @brief One accepted record_metric call, as handed to observers.
 */
struct Observation {
    std::string_view      name;      ///< Metric name (rule binding key)
    std::string_view      key;       ///< Canonical key of the series
    MetricKind            kind;      ///< Series kind
    double                value;     ///< Value passed to this call
    const MetricSnapshot& aggregate; ///< Aggregate right after this call
    util::Timestamp       at;        ///< Record time
    uint64_t              seq;       ///< Store-wide apply order; monotonic per series
};

/** @class MetricObserver
 *  @brief Synchronous sink notified after every accepted record.
 */
class MetricObserver {
public:
    virtual ~MetricObserver() = default;
    /// Must not block on I/O; runs on the recording thread.
    virtual void on_metric(const Observation& obs) = 0;
};

} // namespace vigil::metrics

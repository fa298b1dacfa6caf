#pragma once
/**
 * @file health_reporter.hpp
 * @brief Point-in-time health view composed from metrics, executions and alerts.
 */

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

#include "vigil/alerts/alert_engine.hpp"
#include "vigil/exec/execution_tracker.hpp"
#include "vigil/metrics/metric_store.hpp"

namespace vigil::health {

/** @enum HealthStatus
 *  @brief Overall classification derived from active alerts.
 */
enum class HealthStatus : std::uint8_t { Healthy, Degraded, Error };

std::string_view to_string(HealthStatus s) noexcept;

/** @struct HealthSnapshot
 *  @brief Composite read-only view. Per-component consistency only.
 */
struct HealthSnapshot {
    HealthStatus               status{HealthStatus::Healthy}; ///< Derived overall status
    exec::ExecutionCounts      executions;                    ///< Retained executions by status
    std::vector<alerts::Alert> active_alerts;                 ///< Newest first
    metrics::MetricsSummary    metrics;                       ///< Full metrics summary

    bool operator==(const HealthSnapshot&) const = default;
};

/** @class HealthReporter
 *  @brief Pure read composition; holds references only.
 */
class HealthReporter {
public:
    HealthReporter(const metrics::MetricStore& store,
                   const exec::ExecutionTracker& tracker,
                   const alerts::AlertEngine& alerts,
                   std::chrono::seconds alert_window) noexcept
        : store_(store), tracker_(tracker), alerts_(alerts), alert_window_(alert_window) {}

    /// Compose a fresh snapshot. Never mutates the observed components.
    [[nodiscard]] HealthSnapshot snapshot() const;

    /**
     * @brief Error if any alert is critical, Degraded if any alert exists, else Healthy.
     */
    static HealthStatus classify(const std::vector<alerts::Alert>& active) noexcept;

private:
    const metrics::MetricStore&   store_;
    const exec::ExecutionTracker& tracker_;
    const alerts::AlertEngine&    alerts_;
    std::chrono::seconds          alert_window_;
};

} // namespace vigil::health

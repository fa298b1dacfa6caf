#pragma once
/**
 * @file monitor.hpp
 * @brief Monitoring facade: execution lifecycle, metrics, alerts and health.
 * @details One Monitor is constructed at process start and passed by reference
 *          to request-handling code. It owns every record it tracks; callers only
 *          pass values in and receive copies out.
 *
 * Recording contract:
 *  - start_execution / record_metric surface caller bugs as ObsErr.
 *  - record_function_call / end_execution never fail observably; problems are
 *    counted and logged through Diagnostics.
 *  - No operation waits on I/O; critical sections cover one shard or one entry.
 */

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "vigil/alerts/alert_engine.hpp"
#include "vigil/config/monitor_config.hpp"
#include "vigil/exec/execution_tracker.hpp"
#include "vigil/health/health_reporter.hpp"
#include "vigil/metrics/metric_store.hpp"
#include "vigil/obs/diagnostics.hpp"
#include "vigil/obs/errors.hpp"
#include "vigil/util/clock.hpp"

namespace vigil::obs {

/// Timer fed by every accepted function call (label: function).
inline constexpr std::string_view kCallDurationMetric = "function_call_duration_ms";
/// Counter fed by every failed function call (label: function).
inline constexpr std::string_view kCallFailureMetric  = "function_call_failures";

class Monitor {
public:
    /**
     * @param cfg Retention, alerting and logging configuration.
     * @param clock Time source; must outlive the monitor.
     * @param logger Diagnostic sink; nullptr selects the shared "vigil" logger
     *               and applies `cfg.log_level` to it.
     */
    explicit Monitor(config::MonitorConfig cfg = {},
                     const util::Clock& clock = util::system_clock(),
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Stops the maintenance thread if running.
    ~Monitor();

    Monitor(const Monitor&)            = delete;
    Monitor& operator=(const Monitor&) = delete;

    // --------------------------- Recording -----------------------------------
    /// Begin tracking @p id. DuplicateExecution if it is still retained.
    Status start_execution(std::string_view id, exec::Metadata metadata = {});

    /// Append a timed sub-call to @p id. Best-effort.
    void record_function_call(std::string_view id, std::string_view name,
                              double duration_ms, bool success) noexcept;

    /// Finalize @p id as Completed or Error. Best-effort.
    void end_execution(std::string_view id, exec::ExecutionStatus status,
                       std::optional<std::string> error_message = std::nullopt) noexcept;

    /// Record one metric value; alert rules bound to @p name are re-evaluated synchronously.
    Status record_metric(std::string_view name, double value,
                         const metrics::Labels& labels = {},
                         metrics::MetricKind kind = metrics::MetricKind::Counter);

    // --------------------------- Queries -------------------------------------
    [[nodiscard]] health::HealthSnapshot get_system_health() const;
    [[nodiscard]] metrics::MetricsSummary get_metrics_summary() const;
    [[nodiscard]] std::optional<exec::ExecutionReport> get_performance_report(std::string_view id) const;

    /// Unresolved alerts triggered within @p window, newest first.
    [[nodiscard]] std::vector<alerts::Alert> list_active_alerts(std::chrono::seconds window) const;
    /// Same, using the configured alert window.
    [[nodiscard]] std::vector<alerts::Alert> list_active_alerts() const;
    /// Every alert raised so far, resolved included.
    [[nodiscard]] std::vector<alerts::Alert> alert_history() const;

    [[nodiscard]] DiagnosticCounters diagnostics() const noexcept { return diag_.counters(); }
    const config::MonitorConfig& config() const noexcept { return cfg_; }

    // --------------------------- Maintenance ---------------------------------
    /// Retention sweep + re-evaluation of every alert rule.
    exec::SweepResult run_maintenance();

    /// Run maintenance every `executions.sweep_interval` on a background thread.
    void start();
    /// Stop the background thread (idempotent).
    void stop();
    [[nodiscard]] bool running() const noexcept;

private:
    void maintenance_loop();

    config::MonitorConfig   cfg_;
    const util::Clock&      clock_;
    Diagnostics             diag_;
    alerts::AlertEngine     alerts_;
    metrics::MetricStore    store_;
    exec::ExecutionTracker  tracker_;
    health::HealthReporter  health_;

    std::mutex              lifecycle_mu_; ///< Serializes start()/stop()
    mutable std::mutex      loop_mu_;
    std::condition_variable loop_cv_;
    bool                    stop_requested_{false};
    std::thread             loop_;
};

} // namespace vigil::obs

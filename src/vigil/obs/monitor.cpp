/**
 * @file monitor.cpp
 * @brief Monitor wiring, best-effort recording paths and the maintenance thread.
 */
#include "vigil/obs/monitor.hpp"

#include <exception>
#include <system_error>

#include <spdlog/spdlog.h>

namespace vigil::obs {

    Monitor::Monitor(config::MonitorConfig cfg, const util::Clock& clock, std::shared_ptr<spdlog::logger> logger)
        : cfg_(std::move(cfg)),
          clock_(clock),
          diag_(logger),
          alerts_(clock_, diag_, cfg_.rules),
          store_(clock_, &alerts_, cfg_.timer_reservoir_size),
          tracker_(clock_, diag_, cfg_.executions),
          health_(store_, tracker_, alerts_, cfg_.alert_window) {
        if (!logger) {
            diag_.log().set_level(spdlog::level::from_str(cfg_.log_level));
        }
        diag_.log().info("monitor ready: {} alert rule(s), retention={}s, max_retained={}",
                         alerts_.rules().size(), cfg_.executions.retention.count(),
                         cfg_.executions.max_retained);
    }

    Monitor::~Monitor() { stop(); }

    //--------------------------- Recording -------------------------------------

    Status Monitor::start_execution(std::string_view id, exec::Metadata metadata) {
        return tracker_.start(id, std::move(metadata));
    }

    void Monitor::record_function_call(std::string_view id, std::string_view name,
                                       double duration_ms, bool success) noexcept {
        try {
            if (!tracker_.record_call(id, name, duration_ms, success)) return;
            if (!cfg_.record_call_metrics) return;

            const metrics::Labels labels{{"function", std::string(name)}};
            if (auto st = store_.record(kCallDurationMetric, duration_ms, labels, metrics::MetricKind::Timer); !st) {
                diag_.log().warn("call metric for '{}' rejected: {}", name, to_string(st.error()));
            }
            if (!success) {
                if (auto st = store_.record(kCallFailureMetric, 1.0, labels, metrics::MetricKind::Counter); !st) {
                    diag_.log().warn("call failure metric for '{}' rejected: {}", name, to_string(st.error()));
                }
            }
        } catch (const std::exception& e) {
            diag_.log().error("record_function_call failed for '{}': {}", id, e.what());
        }
    }

    void Monitor::end_execution(std::string_view id, exec::ExecutionStatus status,
                                std::optional<std::string> error_message) noexcept {
        try {
            tracker_.end(id, status, std::move(error_message));
        } catch (const std::exception& e) {
            diag_.log().error("end_execution failed for '{}': {}", id, e.what());
        }
    }

    Status Monitor::record_metric(std::string_view name, double value,
                                  const metrics::Labels& labels, metrics::MetricKind kind) {
        return store_.record(name, value, labels, kind);
    }

    //--------------------------- Queries ---------------------------------------

    health::HealthSnapshot Monitor::get_system_health() const {
        try {
            return health_.snapshot();
        } catch (const std::system_error& e) {
            // Lock acquisition failed: the locking discipline is broken.
            fatal(e.what());
        }
    }

    metrics::MetricsSummary Monitor::get_metrics_summary() const {
        return store_.summary();
    }

    std::optional<exec::ExecutionReport> Monitor::get_performance_report(std::string_view id) const {
        return tracker_.report(id);
    }

    std::vector<alerts::Alert> Monitor::list_active_alerts(std::chrono::seconds window) const {
        return alerts_.active_alerts(window);
    }

    std::vector<alerts::Alert> Monitor::list_active_alerts() const {
        return alerts_.active_alerts(cfg_.alert_window);
    }

    std::vector<alerts::Alert> Monitor::alert_history() const {
        return alerts_.history();
    }

    //--------------------------- Maintenance -----------------------------------

    exec::SweepResult Monitor::run_maintenance() {
        const auto res = tracker_.sweep();
        alerts_.evaluate_all();
        if (res.evicted || res.forced_stale) {
            diag_.log().info("maintenance: evicted={} forced_stale={} retained={}",
                             res.evicted, res.forced_stale, tracker_.size());
        }
        return res;
    }

    void Monitor::start() {
        std::lock_guard life(lifecycle_mu_);
        std::lock_guard lk(loop_mu_);
        if (loop_.joinable()) return;
        stop_requested_ = false;
        loop_ = std::thread([this] { maintenance_loop(); });
        diag_.log().info("maintenance thread started (interval={}s)", cfg_.executions.sweep_interval.count());
    }

    void Monitor::stop() {
        std::lock_guard life(lifecycle_mu_); // no start() until the old thread is joined
        std::thread t;
        {
            std::lock_guard lk(loop_mu_);
            if (!loop_.joinable()) return;
            stop_requested_ = true;
            t = std::move(loop_);
        }
        loop_cv_.notify_all();
        t.join();
        diag_.log().info("maintenance thread stopped");
    }

    bool Monitor::running() const noexcept {
        std::lock_guard lk(loop_mu_);
        return loop_.joinable();
    }

    void Monitor::maintenance_loop() {
        std::unique_lock lk(loop_mu_);
        while (!stop_requested_) {
            // Real time, independent of the injected clock.
            loop_cv_.wait_for(lk, cfg_.executions.sweep_interval, [this] { return stop_requested_; });
            if (stop_requested_) break;
            lk.unlock();
            try {
                (void)run_maintenance();
            } catch (const std::exception& e) {
                diag_.log().error("maintenance pass failed: {}", e.what());
            }
            lk.lock();
        }
    }

} // namespace vigil::obs

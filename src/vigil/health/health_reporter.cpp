/**
 * @file health_reporter.cpp
 * @brief Implementation of HealthReporter.
 */
#include "vigil/health/health_reporter.hpp"

#include <algorithm>

namespace vigil::health {

    std::string_view to_string(HealthStatus s) noexcept {
        switch (s) {
            case HealthStatus::Healthy:  return "healthy";
            case HealthStatus::Degraded: return "degraded";
            case HealthStatus::Error:    return "error";
        }
        return "unknown";
    }

    HealthStatus HealthReporter::classify(const std::vector<alerts::Alert>& active) noexcept {
        if (active.empty()) return HealthStatus::Healthy;
        const bool critical = std::any_of(active.begin(), active.end(), [](const alerts::Alert& a) {
            return a.severity == alerts::Severity::Critical;
        });
        return critical ? HealthStatus::Error : HealthStatus::Degraded;
    }

    HealthSnapshot HealthReporter::snapshot() const {
        HealthSnapshot snap;
        snap.active_alerts = alerts_.active_alerts(alert_window_);
        snap.status = classify(snap.active_alerts);
        snap.executions = tracker_.counts();
        snap.metrics = store_.summary();
        return snap;
    }

} // namespace vigil::health

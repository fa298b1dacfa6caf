#pragma once
/**
 * @file alert_engine.hpp
 * @brief Evaluates threshold rules as metrics are recorded; creates and resolves alerts.
 *
 * The rule set is fixed at construction. A metric-name → rule index is built once
 * and never mutated, so the hot path looks rules up without locking and only
 * locks the rules bound to the recorded metric. Each rule owns its window
 * samples, its open alert (at most one) and its resolved history.
 * Queries resolve alerts whose window has emptied, so no maintenance pass is
 * needed for reads to be current.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigil/alerts/alert_rule.hpp"
#include "vigil/metrics/metric_types.hpp"
#include "vigil/obs/diagnostics.hpp"
#include "vigil/util/clock.hpp"

namespace vigil::alerts {

class AlertEngine final : public metrics::MetricObserver {
public:
    AlertEngine(const util::Clock& clock, obs::Diagnostics& diag, std::vector<AlertRule> rules);

    AlertEngine(const AlertEngine&)            = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /// Hot path: re-evaluate rules bound to `obs.name` only.
    void on_metric(const metrics::Observation& obs) override;

    /// Re-evaluate every rule against its window without a new observation.
    void evaluate_all();

    /**
     * @brief Unresolved alerts whose timestamp lies within @p window of now.
     * @details Alerts whose rule window no longer crosses are resolved first.
     *          Reads never raise or refresh an alert.
     * @return Newest first.
     */
    [[nodiscard]] std::vector<Alert> active_alerts(std::chrono::seconds window) const;

    /// Every alert raised so far, resolved included (expired ones resolved first). Newest first.
    [[nodiscard]] std::vector<Alert> history() const;

    /// Rules accepted at construction.
    [[nodiscard]] std::vector<AlertRule> rules() const;

private:
    /// Coalesced observations; merging keeps sum/count/max exact.
    struct Sample {
        util::Timestamp at{};
        uint64_t seq{0};              ///< Store apply order, breaks ties on `at`
        double sum{0.0};
        double max{0.0};
        double last{0.0};
        std::size_t count{0};
    };

    struct RuleState {
        explicit RuleState(AlertRule r) : rule(std::move(r)) {}

        const AlertRule rule;
        mutable std::mutex mu;
        std::deque<Sample> samples;
        std::string last_metric;      ///< Canonical key of the last matching series
        std::optional<Alert> open;    ///< Unresolved alert, if any
        std::vector<Alert> resolved;  ///< Closed alerts, oldest first
    };

    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct NameEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    /// Raise, refresh or resolve from the current window.
    void evaluate_locked(RuleState& st, util::Timestamp now) const;
    /// Resolve only: used on the read path.
    void expire_locked(RuleState& st, util::Timestamp now) const;
    void resolve_locked(RuleState& st, util::Timestamp now) const;
    static void prune_locked(RuleState& st, util::Timestamp now);
    static std::optional<double> statistic_locked(const RuleState& st);

    const util::Clock& clock_;
    obs::Diagnostics&  diag_;
    std::vector<std::unique_ptr<RuleState>> states_;
    std::unordered_map<std::string, std::vector<std::size_t>, NameHash, NameEq> by_metric_;
    mutable std::atomic<uint64_t> next_id_{1};
};

} // namespace vigil::alerts

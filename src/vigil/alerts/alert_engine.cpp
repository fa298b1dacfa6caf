/**
 * @file alert_engine.cpp
 * @brief Rule evaluation, alert lifecycle and alert queries.
 */
#include "vigil/alerts/alert_engine.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/fmt/fmt.h>

#include "vigil/config/constants.hpp"

namespace vigil::alerts {

static bool newest_first(const Alert& a, const Alert& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.id > b.id;
}

AlertEngine::AlertEngine(const util::Clock& clock, obs::Diagnostics& diag, std::vector<AlertRule> rules)
    : clock_(clock), diag_(diag) {
    states_.reserve(rules.size());
    for (auto& r : rules) {
        if (r.name.empty() || r.metric_name.empty() || r.window.count() <= 0) {
            diag_.log().warn("alert rule '{}' ignored: empty name/metric or non-positive window", r.name);
            continue;
        }
        const bool dup = std::any_of(states_.begin(), states_.end(),
                                     [&](const auto& st) { return st->rule.name == r.name; });
        if (dup) {
            diag_.log().warn("alert rule '{}' ignored: duplicate name", r.name);
            continue;
        }
        by_metric_[r.metric_name].push_back(states_.size());
        states_.push_back(std::make_unique<RuleState>(std::move(r)));
    }
}

//------------------------------- Evaluation -----------------------------------

void AlertEngine::prune_locked(RuleState& st, util::Timestamp now) {
    const auto cutoff = now - st.rule.window;
    while (!st.samples.empty() && st.samples.front().at < cutoff) st.samples.pop_front();
}

std::optional<double> AlertEngine::statistic_locked(const RuleState& st) {
    if (st.samples.empty()) return std::nullopt;
    double sum = 0.0, max = st.samples.front().max;
    std::size_t count = 0;
    for (const auto& s : st.samples) {
        sum += s.sum;
        count += s.count;
        max = std::max(max, s.max);
    }
    switch (st.rule.statistic) {
        case RuleStatistic::WindowSum:  return sum;
        case RuleStatistic::WindowMean: return count ? sum / static_cast<double>(count) : 0.0;
        case RuleStatistic::WindowMax:  return max;
        case RuleStatistic::Last:       return st.samples.back().last;
    }
    return std::nullopt;
}

void AlertEngine::resolve_locked(RuleState& st, util::Timestamp now) const {
    st.open->resolved = true;
    st.open->resolved_at = now;
    diag_.log().info("alert resolved [{}] {}", to_string(st.open->severity), st.rule.name);
    st.resolved.push_back(std::move(*st.open));
    st.open.reset();
}

void AlertEngine::evaluate_locked(RuleState& st, util::Timestamp now) const {
    prune_locked(st, now);
    const auto value = statistic_locked(st);
    const AlertRule& r = st.rule;
    const bool crossed = value && compare(r.comparator, *value, r.threshold);

    if (crossed) {
        auto msg = fmt::format("{}: {}({}) = {} {} {}", r.name, to_string(r.statistic), st.last_metric,
                               *value, to_string(r.comparator), r.threshold);
        if (!st.open) {
            Alert a;
            a.id = "alert-" + std::to_string(next_id_.fetch_add(1, std::memory_order_relaxed));
            a.rule_name = r.name;
            a.severity = r.severity;
            a.message = std::move(msg);
            a.triggering_metric = st.last_metric;
            a.observed_value = *value;
            a.threshold = r.threshold;
            a.first_triggered = now;
            a.timestamp = now;
            diag_.log().info("alert raised [{}] {}", to_string(a.severity), a.message);
            st.open = std::move(a);
        } else {
            st.open->message = std::move(msg);
            st.open->triggering_metric = st.last_metric;
            st.open->observed_value = *value;
            st.open->timestamp = now;
            diag_.log().debug("alert refreshed {}", st.open->message);
        }
        return;
    }

    if (st.open) resolve_locked(st, now);
}

void AlertEngine::expire_locked(RuleState& st, util::Timestamp now) const {
    if (!st.open) return;
    prune_locked(st, now);
    const auto value = statistic_locked(st);
    if (!value || !compare(st.rule.comparator, *value, st.rule.threshold)) resolve_locked(st, now);
}

void AlertEngine::on_metric(const metrics::Observation& obs) {
    auto it = by_metric_.find(obs.name);
    if (it == by_metric_.end()) return;

    const Sample sample{obs.at, obs.seq, obs.value, obs.value, obs.value, 1};
    for (const auto idx : it->second) {
        RuleState& st = *states_[idx];
        std::lock_guard lk(st.mu);

        // Notifications can overtake each other; keep the window ordered by (at, seq).
        auto pos = st.samples.end();
        while (pos != st.samples.begin()) {
            const auto prev = std::prev(pos);
            if (prev->at < sample.at || (prev->at == sample.at && prev->seq < sample.seq)) break;
            pos = prev;
        }
        const bool newest = pos == st.samples.end();
        st.samples.insert(pos, sample);
        if (newest) st.last_metric.assign(obs.key);

        if (st.samples.size() > config::constants::ALERT_RULE_MAX_SAMPLES) {
            // Fold the oldest sample into its neighbour; only its expiry time shifts.
            Sample& next = st.samples[1];
            const Sample& oldest = st.samples.front();
            next.sum += oldest.sum;
            next.count += oldest.count;
            next.max = std::max(next.max, oldest.max);
            st.samples.pop_front();
        }
        evaluate_locked(st, st.samples.back().at);
    }
}

void AlertEngine::evaluate_all() {
    const auto now = clock_.now();
    for (auto& st : states_) {
        std::lock_guard lk(st->mu);
        evaluate_locked(*st, now);
    }
}

//------------------------------- Queries --------------------------------------

std::vector<Alert> AlertEngine::active_alerts(std::chrono::seconds window) const {
    const auto now = clock_.now();
    const auto since = now - window;
    std::vector<Alert> out;
    for (const auto& st : states_) {
        std::lock_guard lk(st->mu);
        expire_locked(*st, now);
        if (st->open && st->open->timestamp >= since) out.push_back(*st->open);
    }
    std::sort(out.begin(), out.end(), newest_first);
    return out;
}

std::vector<Alert> AlertEngine::history() const {
    const auto now = clock_.now();
    std::vector<Alert> out;
    for (const auto& st : states_) {
        std::lock_guard lk(st->mu);
        expire_locked(*st, now);
        out.insert(out.end(), st->resolved.begin(), st->resolved.end());
        if (st->open) out.push_back(*st->open);
    }
    std::sort(out.begin(), out.end(), newest_first);
    return out;
}

std::vector<AlertRule> AlertEngine::rules() const {
    std::vector<AlertRule> out;
    out.reserve(states_.size());
    for (const auto& st : states_) out.push_back(st->rule);
    return out;
}

} // namespace vigil::alerts

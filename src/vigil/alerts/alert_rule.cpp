/**
 * @file alert_rule.cpp
 * @brief Name tables and comparison for alert rules.
 */
#include "vigil/alerts/alert_rule.hpp"

namespace vigil::alerts {

    std::string_view to_string(Severity s) noexcept {
        switch (s) {
            case Severity::Info:     return "info";
            case Severity::Warning:  return "warning";
            case Severity::Critical: return "critical";
        }
        return "unknown";
    }

    std::string_view to_string(Comparator c) noexcept {
        switch (c) {
            case Comparator::Greater:      return ">";
            case Comparator::GreaterEqual: return ">=";
            case Comparator::Less:         return "<";
            case Comparator::LessEqual:    return "<=";
            case Comparator::Equal:        return "==";
        }
        return "?";
    }

    std::string_view to_string(RuleStatistic s) noexcept {
        switch (s) {
            case RuleStatistic::WindowSum:  return "window_sum";
            case RuleStatistic::WindowMean: return "window_mean";
            case RuleStatistic::WindowMax:  return "window_max";
            case RuleStatistic::Last:       return "last";
        }
        return "unknown";
    }

    std::optional<Severity> parse_severity(std::string_view s) noexcept {
        for (auto v : {Severity::Info, Severity::Warning, Severity::Critical}) {
            if (to_string(v) == s) return v;
        }
        return std::nullopt;
    }

    std::optional<Comparator> parse_comparator(std::string_view s) noexcept {
        for (auto v : {Comparator::Greater, Comparator::GreaterEqual, Comparator::Less,
                       Comparator::LessEqual, Comparator::Equal}) {
            if (to_string(v) == s) return v;
        }
        return std::nullopt;
    }

    std::optional<RuleStatistic> parse_statistic(std::string_view s) noexcept {
        for (auto v : {RuleStatistic::WindowSum, RuleStatistic::WindowMean,
                       RuleStatistic::WindowMax, RuleStatistic::Last}) {
            if (to_string(v) == s) return v;
        }
        return std::nullopt;
    }

    bool compare(Comparator c, double value, double threshold) noexcept {
        switch (c) {
            case Comparator::Greater:      return value >  threshold;
            case Comparator::GreaterEqual: return value >= threshold;
            case Comparator::Less:         return value <  threshold;
            case Comparator::LessEqual:    return value <= threshold;
            case Comparator::Equal:        return value == threshold;
        }
        return false;
    }

} // namespace vigil::alerts

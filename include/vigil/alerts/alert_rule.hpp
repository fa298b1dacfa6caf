#pragma once
/**
 * @file alert_rule.hpp
 * @brief Threshold rules and the alerts they raise.
 * @details Default windows are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "vigil/config/constants.hpp"
#include "vigil/util/clock.hpp"

namespace vigil::alerts {

/**
 * @enum Severity
 * @brief Alert severity. Any active Critical alert turns system health to error.
 */
enum class Severity : uint8_t {
    Info = 0,
    Warning,
    Critical
};

/**
 * @enum Comparator
 * @brief How the rule statistic is compared against the threshold.
 */
enum class Comparator : uint8_t {
    Greater,      ///< >
    GreaterEqual, ///< >=
    Less,         ///< <
    LessEqual,    ///< <=
    Equal         ///< ==
};

/**
 * @enum RuleStatistic
 * @brief Quantity computed over the observations inside the rule window.
 */
enum class RuleStatistic : uint8_t {
    WindowSum,  ///< Sum of recorded values (counter increments per window)
    WindowMean, ///< Mean of recorded values
    WindowMax,  ///< Largest recorded value
    Last        ///< Most recent recorded value
};

/**
 * @struct AlertRule
 * @brief One threshold rule bound to a metric name (all label sets).
 */
struct AlertRule {
    std::string   name;                                  ///< Unique rule name
    std::string   metric_name;                           ///< Bound metric name
    Comparator    comparator{Comparator::GreaterEqual};
    double        threshold{0.0};
    Severity      severity{Severity::Warning};
    RuleStatistic statistic{RuleStatistic::WindowSum};
    std::chrono::seconds window{config::constants::ALERT_RULE_WINDOW_S}; ///< Observation window

    bool operator==(const AlertRule&) const = default;
};

/**
 * @struct Alert
 * @brief Derived condition raised by a rule.
 */
struct Alert {
    std::string id;                 ///< Generated ("alert-<seq>")
    std::string rule_name;
    Severity    severity{Severity::Warning};
    std::string message;            ///< Human-readable condition
    std::string triggering_metric;  ///< Canonical key of the last matching series
    double      observed_value{0.0};
    double      threshold{0.0};
    util::Timestamp first_triggered{};
    util::Timestamp timestamp{};    ///< Last time the condition was found crossed
    bool        resolved{false};
    std::optional<util::Timestamp> resolved_at;

    bool operator==(const Alert&) const = default;
};

std::string_view to_string(Severity s) noexcept;
std::string_view to_string(Comparator c) noexcept;
std::string_view to_string(RuleStatistic s) noexcept;

/// Parse helpers for configuration ("warning", ">=", "window_sum", ...).
std::optional<Severity>      parse_severity(std::string_view s) noexcept;
std::optional<Comparator>    parse_comparator(std::string_view s) noexcept;
std::optional<RuleStatistic> parse_statistic(std::string_view s) noexcept;

/// Apply @p c to `(value, threshold)`.
bool compare(Comparator c, double value, double threshold) noexcept;

} // namespace vigil::alerts

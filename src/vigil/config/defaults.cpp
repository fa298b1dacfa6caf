/**
 * @file defaults.cpp
 * @brief Default alert rules, expressed with named constants.
 */
#include "vigil/config/monitor_config.hpp"

namespace vigil::config {
    using namespace vigil::alerts;
    using namespace vigil::config::constants;

    std::vector<AlertRule> default_rules() {
        return {
            AlertRule{.name = "agent_execution_error", .metric_name = "agent_execution_error",
                      .comparator = Comparator::GreaterEqual, .threshold = RULE_EXEC_ERROR_MIN,
                      .severity = Severity::Warning, .statistic = RuleStatistic::WindowSum},
            AlertRule{.name = "high_agent_response_time", .metric_name = "agent_response_time_ms",
                      .comparator = Comparator::Greater, .threshold = RULE_RESPONSE_TIME_MAX_MS,
                      .severity = Severity::Warning, .statistic = RuleStatistic::Last},
            AlertRule{.name = "voice_synthesis_failure", .metric_name = "voice_synthesis_failure",
                      .comparator = Comparator::GreaterEqual, .threshold = RULE_VOICE_FAILURE_MIN,
                      .severity = Severity::Warning, .statistic = RuleStatistic::WindowSum},
            AlertRule{.name = "error_burst", .metric_name = "error_by_category",
                      .comparator = Comparator::GreaterEqual, .threshold = RULE_ERROR_BURST_MIN,
                      .severity = Severity::Critical, .statistic = RuleStatistic::WindowSum},
        };
    }

} // namespace vigil::config

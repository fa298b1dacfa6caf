#pragma once
/**
 * @file monitor_config.hpp
 * @brief Aggregate configuration for one Monitor instance.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "vigil/alerts/alert_rule.hpp"
#include "vigil/config/constants.hpp"
#include "vigil/exec/execution_tracker.hpp"

namespace vigil::config {

    /// Rules bound to the metric names the agent service records.
    std::vector<alerts::AlertRule> default_rules();

    /** @struct MonitorConfig
     *  @brief Aggregate of sub-configs required by the monitor.
     */
    struct MonitorConfig {
        exec::TrackerConfig executions;                                    ///< Retention/staleness policy
        std::chrono::seconds alert_window{constants::ALERT_ACTIVE_WINDOW_S}; ///< Window of the "active" alert view
        std::size_t timer_reservoir_size{constants::TIMER_RESERVOIR_SIZE};   ///< Samples kept per timer
        bool record_call_metrics{true};                                      ///< Feed function calls into timers
        std::string log_level{"info"};                                       ///< spdlog level name
        std::vector<alerts::AlertRule> rules{default_rules()};               ///< Fixed rule set
    };

} // namespace vigil::config

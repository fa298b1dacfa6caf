#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the monitoring core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace vigil::config::constants {

// =====================
// Execution retention
// Units: seconds unless stated otherwise
// =====================
inline constexpr uint32_t EXEC_RETENTION_S          = 3600;   ///< Keep terminal executions for 1 h
inline constexpr uint32_t EXEC_STALE_AFTER_S        = 86400;  ///< Force-terminate running executions after 24 h
inline constexpr std::size_t EXEC_MAX_RETAINED      = 10000;  ///< Upper bound on retained terminal executions
inline constexpr uint32_t SWEEP_INTERVAL_S          = 30;     ///< Min gap between opportunistic sweeps
inline constexpr std::size_t EXEC_CAP_LOW_WATERMARK_PCT = 90; ///< Cap eviction stops at this % of max_retained

// =====================
// Alerting
// =====================
inline constexpr uint32_t ALERT_ACTIVE_WINDOW_S     = 3600;   ///< "Active" alert view: last hour
inline constexpr uint32_t ALERT_RULE_WINDOW_S       = 300;    ///< Default rule evaluation window: 5 min
inline constexpr std::size_t ALERT_RULE_MAX_SAMPLES = 4096;   ///< Per-rule window sample cap

// =====================
// Metric store
// =====================
inline constexpr std::size_t METRIC_SHARDS          = 16;     ///< Shard count for metric keys
inline constexpr std::size_t EXEC_SHARDS            = 16;     ///< Shard count for execution ids
inline constexpr std::size_t TIMER_RESERVOIR_SIZE   = 256;    ///< Recent samples kept per timer

// =====================
// Default rule thresholds (names follow the agent service's metric vocabulary)
// =====================
inline constexpr double RULE_EXEC_ERROR_MIN         = 1.0;    ///< agent_execution_error events per window
inline constexpr double RULE_RESPONSE_TIME_MAX_MS   = 5000.0; ///< agent_response_time_ms ceiling
inline constexpr double RULE_VOICE_FAILURE_MIN      = 3.0;    ///< voice_synthesis_failure events per window
inline constexpr double RULE_ERROR_BURST_MIN        = 10.0;   ///< error_by_category events per window

} // namespace vigil::config::constants

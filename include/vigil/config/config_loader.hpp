#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: JSON file → MonitorConfig.
 * @details Missing fields keep the named defaults from constants.hpp.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "vigil/compat/expected.hpp"
#include "vigil/config/monitor_config.hpp"

namespace vigil::config {

    /// Result codes for configuration loading.
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1, ///< Path missing or unreadable
        ParseError,       ///< Not a JSON document
        InvalidValue      ///< Wrong type, out of range, or unknown enum name
    };

    std::string_view to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of monitor configuration (defaults or parsed files).
     *
     * Document layout (every key optional):
     * @code
     * {
     *   "executions": { "retention_s": 3600, "max_retained": 10000,
     *                   "stale_after_s": 86400, "sweep_interval_s": 30 },
     *   "alert_window_s": 3600,
     *   "timer_reservoir_size": 256,
     *   "record_call_metrics": true,
     *   "log_level": "info",
     *   "rules": [ { "name": "agent_execution_error", "metric": "agent_execution_error",
     *                "comparator": ">=", "threshold": 1, "severity": "warning",
     *                "statistic": "window_sum", "window_s": 300 } ]
     * }
     * @endcode
     * A present "rules" array replaces the default rule set.
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a JSON file.
         * @param path File path.
         * @return MonitorConfig, or the first error encountered.
         */
        static vigil_detail::expected<MonitorConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static vigil_detail::expected<MonitorConfig, ConfigError> load_from_string(std::string_view text);
    };

} // namespace vigil::config

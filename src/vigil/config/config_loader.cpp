/**
* @file config_loader.cpp
 * @brief nlohmann::json-backed loader; defaults come from MonitorConfig.
 */
#include "vigil/config/config_loader.hpp"

#include <array>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace vigil::config {
    using json = nlohmann::json;
    using vigil_detail::unexpected;

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    static bool valid_level(std::string_view lvl) {
        static constexpr std::array<std::string_view, 9> names{
            "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};
        for (auto n : names) if (n == lvl) return true;
        return false;
    }

    // Reads a strictly positive number of seconds; leaves @p out untouched if absent.
    static bool read_seconds(const json& j, const char* key, std::chrono::seconds& out) {
        if (!j.contains(key)) return true;
        const auto v = j.at(key).get<int64_t>();
        if (v <= 0) return false;
        out = std::chrono::seconds{v};
        return true;
    }

    static bool read_count(const json& j, const char* key, std::size_t& out) {
        if (!j.contains(key)) return true;
        const auto v = j.at(key).get<int64_t>();
        if (v <= 0) return false;
        out = static_cast<std::size_t>(v);
        return true;
    }

    static vigil_detail::expected<alerts::AlertRule, ConfigError> parse_rule(const json& j) {
        alerts::AlertRule r;
        r.name = j.at("name").get<std::string>();
        r.metric_name = j.value("metric", r.name);
        r.threshold = j.at("threshold").get<double>();

        const auto cmp = alerts::parse_comparator(j.value("comparator", std::string(">=")));
        const auto sev = alerts::parse_severity(j.value("severity", std::string("warning")));
        const auto stat = alerts::parse_statistic(j.value("statistic", std::string("window_sum")));
        if (!cmp || !sev || !stat || r.name.empty() || r.metric_name.empty()) {
            return unexpected(ConfigError::InvalidValue);
        }
        r.comparator = *cmp;
        r.severity = *sev;
        r.statistic = *stat;
        if (!read_seconds(j, "window_s", r.window)) return unexpected(ConfigError::InvalidValue);
        return r;
    }

    vigil_detail::expected<MonitorConfig, ConfigError> Loader::load_from_string(std::string_view text) {
        const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded() || !doc.is_object()) return unexpected(ConfigError::ParseError);

        MonitorConfig cfg;
        try {
            if (doc.contains("executions")) {
                const auto& ex = doc.at("executions");
                if (!read_seconds(ex, "retention_s", cfg.executions.retention) ||
                    !read_count(ex, "max_retained", cfg.executions.max_retained) ||
                    !read_seconds(ex, "stale_after_s", cfg.executions.stale_after) ||
                    !read_seconds(ex, "sweep_interval_s", cfg.executions.sweep_interval)) {
                    return unexpected(ConfigError::InvalidValue);
                }
            }
            if (!read_seconds(doc, "alert_window_s", cfg.alert_window) ||
                !read_count(doc, "timer_reservoir_size", cfg.timer_reservoir_size)) {
                return unexpected(ConfigError::InvalidValue);
            }
            cfg.record_call_metrics = doc.value("record_call_metrics", cfg.record_call_metrics);
            cfg.log_level = doc.value("log_level", cfg.log_level);
            if (!valid_level(cfg.log_level)) return unexpected(ConfigError::InvalidValue);

            if (doc.contains("rules")) {
                const auto& arr = doc.at("rules");
                if (!arr.is_array()) return unexpected(ConfigError::InvalidValue);
                cfg.rules.clear();
                for (const auto& jr : arr) {
                    auto rule = parse_rule(jr);
                    if (!rule) return unexpected(rule.error());
                    cfg.rules.push_back(std::move(*rule));
                }
            }
        } catch (const json::exception&) {
            // type_error / out_of_range: wrong type or missing mandatory rule field
            return unexpected(ConfigError::InvalidValue);
        }
        return cfg;
    }

    vigil_detail::expected<MonitorConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return unexpected(ConfigError::FileNotFound);
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_string(ss.str());
    }

} // namespace vigil::config

#pragma once
/**
 * @file diagnostics.hpp
 * @brief Internal diagnostic channel for best-effort instrumentation paths.
 * @details Recording calls that cannot be applied are never surfaced to the
 *          instrumented code. They are counted here and logged through spdlog.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

namespace vigil::obs {

/** @enum DropReason
 *  @brief Why a best-effort call was discarded.
 */
enum class DropReason : std::uint8_t {
    UnknownExecution,  ///< id never started or already evicted
    TerminalExecution, ///< id already completed/errored
    InvalidArgument    ///< negative/non-finite duration, bad status, empty name
};

/** @struct DiagnosticCounters
 *  @brief Cumulative counts since construction.
 */
struct DiagnosticCounters {
    uint64_t unknown_execution{0};  ///< Calls against unknown ids
    uint64_t terminal_execution{0}; ///< Calls against finished executions
    uint64_t invalid_argument{0};   ///< Calls dropped for malformed input
    uint64_t repaired_end{0};       ///< end_execution calls fixed up (missing/extra message)
    uint64_t evicted{0};            ///< Terminal executions removed by retention
    uint64_t forced_stale{0};       ///< Running executions force-terminated as stale

    bool operator==(const DiagnosticCounters&) const = default;
};

std::string_view to_string(DropReason r) noexcept;

/** @class Diagnostics
 *  @brief Counters + logger shared by every component of one Monitor.
 */
class Diagnostics {
public:
    /// @param logger Sink to use; nullptr selects the shared "vigil" logger.
    explicit Diagnostics(std::shared_ptr<spdlog::logger> logger = nullptr);

    Diagnostics(const Diagnostics&)            = delete;
    Diagnostics& operator=(const Diagnostics&) = delete;

    /// Logger for regular lifecycle messages.
    spdlog::logger& log() const noexcept { return *logger_; }

    /// Report a discarded best-effort call.
    void dropped(DropReason reason, std::string_view op, std::string_view execution_id) noexcept;

    /// Report an end_execution call whose arguments had to be corrected.
    void repaired_end(std::string_view execution_id, std::string_view what) noexcept;

    void evicted(std::size_t n) noexcept;
    void forced_stale(std::size_t n) noexcept;

    [[nodiscard]] DiagnosticCounters counters() const noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<uint64_t> unknown_{0}, terminal_{0}, invalid_{0};
    std::atomic<uint64_t> repaired_{0}, evicted_{0}, stale_{0};
};

/// Shared named logger ("vigil"), created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> default_logger();

/**
 * @brief Report an internal invariant violation and terminate.
 * @details Silently wrong observability data is worse than a crash.
 */
[[noreturn]] void fatal(std::string_view what) noexcept;

} // namespace vigil::obs

#pragma once
/**
 * @file execution_tracker.hpp
 * @brief Per-request execution lifecycle records with bounded retention.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 *
 * Concurrency: execution ids hash to one of N shards, each with its own mutex,
 * so unrelated executions rarely contend. The retention sweep is serialized by
 * a separate mutex and visits one shard at a time.
 */

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vigil/config/constants.hpp"
#include "vigil/exec/execution.hpp"
#include "vigil/obs/diagnostics.hpp"
#include "vigil/obs/errors.hpp"
#include "vigil/util/clock.hpp"

namespace vigil::exec {

/** @struct TrackerConfig
 *  @brief Retention and staleness policy.
 */
struct TrackerConfig {
    std::chrono::seconds retention{config::constants::EXEC_RETENTION_S};       ///< Keep terminal records this long
    std::size_t          max_retained{config::constants::EXEC_MAX_RETAINED};   ///< Cap on retained terminal records
    std::chrono::seconds stale_after{config::constants::EXEC_STALE_AFTER_S};   ///< Running-record ceiling
    std::chrono::seconds sweep_interval{config::constants::SWEEP_INTERVAL_S};  ///< Min gap between opportunistic sweeps
};

/** @struct SweepResult
 *  @brief Outcome of one retention pass.
 */
struct SweepResult {
    std::size_t evicted{0};       ///< Terminal records removed
    std::size_t forced_stale{0};  ///< Running records force-terminated
};

/** @class ExecutionTracker
 *  @brief Owns every execution record of one monitor.
 */
class ExecutionTracker final {
public:
    ExecutionTracker(const util::Clock& clock, obs::Diagnostics& diag, TrackerConfig cfg = {});

    ExecutionTracker(const ExecutionTracker&)            = delete;
    ExecutionTracker& operator=(const ExecutionTracker&) = delete;

    /**
     * @brief Create a running record.
     * @return DuplicateExecution if @p id is still retained; InvalidArgument if empty.
     */
    obs::Status start(std::string_view id, Metadata metadata);

    /**
     * @brief Append a call record. Best-effort: failures go to Diagnostics.
     * @return true if the call was appended.
     */
    bool record_call(std::string_view id, std::string_view name, double duration_ms, bool success);

    /**
     * @brief Finalize an execution. Best-effort: failures go to Diagnostics.
     * @param status Completed or Error.
     * @param error_message Required iff status == Error (repaired otherwise).
     */
    void end(std::string_view id, ExecutionStatus status, std::optional<std::string> error_message = std::nullopt);

    /// Copy of the record, or std::nullopt if unknown, evicted or past retention.
    [[nodiscard]] std::optional<ExecutionReport> report(std::string_view id) const;

    /// Retained records by status; terminal records past retention are not counted.
    [[nodiscard]] ExecutionCounts counts() const;

    /// Number of records counted by counts().
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Evict expired terminal records and force-terminate stale running ones.
     * @details Blocks until any concurrent sweep finishes. When the count cap is
     *          exceeded, evicts down to EXEC_CAP_LOW_WATERMARK_PCT of the cap.
     */
    SweepResult sweep();

    const TrackerConfig& config() const noexcept { return cfg_; }

private:
    struct Record {
        Metadata metadata;
        ExecutionStatus status{ExecutionStatus::Running};
        util::Timestamp start_time{};
        util::Timestamp end_time{};
        std::string error_message;
        std::vector<FunctionCall> calls;
    };

    struct IdHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct IdEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<std::string, Record, IdHash, IdEq> records;
    };

    Shard& shard_for(std::string_view id) noexcept;
    const Shard& shard_for(std::string_view id) const noexcept;

    /// Sweep if the interval elapsed or the terminal cap is exceeded; skips if another sweep runs.
    void maybe_sweep(util::Timestamp now);
    SweepResult sweep_locked(util::Timestamp now);
    void mark_terminal(ExecutionStatus to) noexcept;
    /// Terminal and older than the retention window (invisible to readers).
    bool expired(const Record& rec, util::Timestamp now) const noexcept;

    const util::Clock& clock_;
    obs::Diagnostics&  diag_;
    TrackerConfig      cfg_;
    std::array<Shard, config::constants::EXEC_SHARDS> shards_{};

    std::atomic<std::size_t> completed_{0}, errored_{0}; ///< Terminal records held, for the cap check
    std::atomic<util::Duration::rep> last_sweep_{0};
    std::mutex sweep_mu_;
};

} // namespace vigil::exec

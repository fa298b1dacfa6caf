/**
 * @file execution_tracker.cpp
 * @brief Implementation of ExecutionTracker and its retention sweep.
 */
#include "vigil/exec/execution_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>
#include <vector>

namespace vigil::exec {

std::string_view to_string(ExecutionStatus s) noexcept {
    switch (s) {
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Error:     return "error";
    }
    return "unknown";
}

ExecutionTracker::ExecutionTracker(const util::Clock& clock, obs::Diagnostics& diag, TrackerConfig cfg)
    : clock_(clock), diag_(diag), cfg_(cfg) {}

ExecutionTracker::Shard& ExecutionTracker::shard_for(std::string_view id) noexcept {
    return shards_[IdHash{}(id) % shards_.size()];
}

const ExecutionTracker::Shard& ExecutionTracker::shard_for(std::string_view id) const noexcept {
    return shards_[IdHash{}(id) % shards_.size()];
}

void ExecutionTracker::mark_terminal(ExecutionStatus to) noexcept {
    if (to == ExecutionStatus::Completed) completed_.fetch_add(1, std::memory_order_relaxed);
    if (to == ExecutionStatus::Error)     errored_.fetch_add(1, std::memory_order_relaxed);
}

//------------------------------- Lifecycle ------------------------------------

obs::Status ExecutionTracker::start(std::string_view id, Metadata metadata) {
    if (id.empty()) return vigil_detail::unexpected(obs::ObsErr::InvalidArgument);

    const auto now = clock_.now();
    bool reclaimed = false;
    {
        Shard& sh = shard_for(id);
        std::lock_guard lk(sh.mu);
        if (auto it = sh.records.find(id); it != sh.records.end()) {
            if (!expired(it->second, now)) return vigil_detail::unexpected(obs::ObsErr::DuplicateExecution);
            // Past retention but not yet swept: already invisible, reclaim the id.
            (it->second.status == ExecutionStatus::Completed ? completed_ : errored_).fetch_sub(1, std::memory_order_relaxed);
            sh.records.erase(it);
            reclaimed = true;
        }
        Record rec;
        rec.metadata = std::move(metadata);
        rec.start_time = now;
        sh.records.emplace(std::string(id), std::move(rec));
    }
    if (reclaimed) diag_.evicted(1);
    diag_.log().debug("execution '{}' started", id);

    maybe_sweep(now);
    return {};
}

bool ExecutionTracker::record_call(std::string_view id, std::string_view name, double duration_ms, bool success) {
    if (name.empty() || !std::isfinite(duration_ms) || duration_ms < 0.0) {
        diag_.dropped(obs::DropReason::InvalidArgument, "record_function_call", id);
        return false;
    }

    const auto now = clock_.now();
    Shard& sh = shard_for(id);
    std::unique_lock lk(sh.mu);
    auto it = sh.records.find(id);
    if (it == sh.records.end()) {
        lk.unlock();
        diag_.dropped(obs::DropReason::UnknownExecution, "record_function_call", id);
        return false;
    }
    if (it->second.status != ExecutionStatus::Running) {
        lk.unlock();
        diag_.dropped(obs::DropReason::TerminalExecution, "record_function_call", id);
        return false;
    }
    it->second.calls.push_back(FunctionCall{std::string(name), duration_ms, success, now});
    return true;
}

void ExecutionTracker::end(std::string_view id, ExecutionStatus status, std::optional<std::string> error_message) {
    if (status == ExecutionStatus::Running) {
        diag_.dropped(obs::DropReason::InvalidArgument, "end_execution", id);
        return;
    }
    if (status == ExecutionStatus::Error && (!error_message || error_message->empty())) {
        diag_.repaired_end(id, "error status without message");
        error_message = "unspecified error";
    } else if (status == ExecutionStatus::Completed && error_message) {
        diag_.repaired_end(id, "message supplied with completed status");
        error_message.reset();
    }

    const auto now = clock_.now();
    Shard& sh = shard_for(id);
    std::unique_lock lk(sh.mu);
    auto it = sh.records.find(id);
    if (it == sh.records.end()) {
        lk.unlock();
        diag_.dropped(obs::DropReason::UnknownExecution, "end_execution", id);
        return;
    }
    Record& rec = it->second;
    if (rec.status != ExecutionStatus::Running) {
        lk.unlock();
        diag_.dropped(obs::DropReason::TerminalExecution, "end_execution", id);
        return;
    }
    rec.status = status;
    rec.end_time = now;
    if (error_message) rec.error_message = std::move(*error_message);
    mark_terminal(status);
    const double total_ms = util::elapsed_ms(rec.start_time, now);
    lk.unlock();

    diag_.log().debug("execution '{}' ended: {} after {:.2f}ms", id, to_string(status), total_ms);
}

//------------------------------- Queries --------------------------------------

std::optional<ExecutionReport> ExecutionTracker::report(std::string_view id) const {
    const auto now = clock_.now();
    const Shard& sh = shard_for(id);
    std::lock_guard lk(sh.mu);
    auto it = sh.records.find(id);
    if (it == sh.records.end()) return std::nullopt;

    const Record& rec = it->second;
    if (expired(rec, now)) return std::nullopt; // awaiting the next sweep
    ExecutionReport r;
    r.execution_id = it->first;
    r.metadata = rec.metadata;
    r.status = rec.status;
    r.start_time = rec.start_time;
    r.calls = rec.calls;
    if (rec.status == ExecutionStatus::Running) {
        r.total_duration_ms = util::elapsed_ms(rec.start_time, now);
    } else {
        r.end_time = rec.end_time;
        r.total_duration_ms = util::elapsed_ms(rec.start_time, rec.end_time);
    }
    if (rec.status == ExecutionStatus::Error) r.error_message = rec.error_message;
    for (const auto& c : rec.calls) {
        if (!c.success) ++r.failed_calls;
        r.call_time_ms += c.duration_ms;
    }
    return r;
}

bool ExecutionTracker::expired(const Record& rec, util::Timestamp now) const noexcept {
    return rec.status != ExecutionStatus::Running && rec.end_time < now - cfg_.retention;
}

ExecutionCounts ExecutionTracker::counts() const {
    const auto now = clock_.now();
    ExecutionCounts c;
    for (const auto& sh : shards_) {
        std::lock_guard lk(sh.mu);
        for (const auto& [id, rec] : sh.records) {
            if (expired(rec, now)) continue;
            switch (rec.status) {
                case ExecutionStatus::Running:   ++c.running; break;
                case ExecutionStatus::Completed: ++c.completed; break;
                case ExecutionStatus::Error:     ++c.error; break;
            }
        }
    }
    return c;
}

std::size_t ExecutionTracker::size() const {
    const auto c = counts();
    return c.running + c.completed + c.error;
}

//------------------------------- Retention ------------------------------------

void ExecutionTracker::maybe_sweep(util::Timestamp now) {
    const auto terminal = completed_.load(std::memory_order_relaxed) + errored_.load(std::memory_order_relaxed);
    const auto last = util::Timestamp{util::Duration{last_sweep_.load(std::memory_order_relaxed)}};
    if (terminal <= cfg_.max_retained && now - last < cfg_.sweep_interval) return;

    std::unique_lock lk(sweep_mu_, std::try_to_lock);
    if (!lk.owns_lock()) return; // another thread is already sweeping
    const auto res = sweep_locked(now);
    diag_.evicted(res.evicted);
    diag_.forced_stale(res.forced_stale);
}

SweepResult ExecutionTracker::sweep() {
    std::lock_guard lk(sweep_mu_);
    const auto res = sweep_locked(clock_.now());
    diag_.evicted(res.evicted);
    diag_.forced_stale(res.forced_stale);
    return res;
}

SweepResult ExecutionTracker::sweep_locked(util::Timestamp now) {
    SweepResult res;
    last_sweep_.store(now.time_since_epoch().count(), std::memory_order_relaxed);
    const auto evict_before = now - cfg_.retention;
    const auto stale_before = now - cfg_.stale_after;
    const std::string stale_msg = "stale: no end_execution within " + std::to_string(cfg_.stale_after.count()) + "s";

    // Pass 1: time-based eviction + staleness, one shard at a time.
    for (auto& sh : shards_) {
        std::lock_guard lk(sh.mu);
        for (auto it = sh.records.begin(); it != sh.records.end();) {
            Record& rec = it->second;
            if (rec.status == ExecutionStatus::Running) {
                if (rec.start_time < stale_before) {
                    rec.status = ExecutionStatus::Error;
                    rec.end_time = now;
                    rec.error_message = stale_msg;
                    mark_terminal(ExecutionStatus::Error);
                    ++res.forced_stale;
                }
                ++it;
                continue;
            }
            if (rec.end_time < evict_before) {
                (rec.status == ExecutionStatus::Completed ? completed_ : errored_).fetch_sub(1, std::memory_order_relaxed);
                it = sh.records.erase(it);
                ++res.evicted;
                continue;
            }
            ++it;
        }
    }

    // Pass 2: count cap, oldest terminal records first.
    const auto terminal = completed_.load(std::memory_order_relaxed) + errored_.load(std::memory_order_relaxed);
    if (terminal <= cfg_.max_retained) return res;

    std::vector<std::tuple<util::Timestamp, std::string, std::size_t>> candidates;
    candidates.reserve(terminal);
    for (std::size_t i = 0; i < shards_.size(); ++i) {
        std::lock_guard lk(shards_[i].mu);
        for (const auto& [id, rec] : shards_[i].records) {
            if (rec.status != ExecutionStatus::Running) candidates.emplace_back(rec.end_time, id, i);
        }
    }
    if (candidates.size() <= cfg_.max_retained) return res;

    // Evict down to the low watermark so the next few ends do not re-trigger a full pass.
    const std::size_t target = cfg_.max_retained * config::constants::EXEC_CAP_LOW_WATERMARK_PCT / 100;
    const std::size_t excess = candidates.size() - target;
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(excess), candidates.end());
    for (std::size_t n = 0; n < excess; ++n) {
        const auto& [end_time, id, shard_idx] = candidates[n];
        Shard& sh = shards_[shard_idx];
        std::lock_guard lk(sh.mu);
        auto it = sh.records.find(std::string_view{id});
        // Terminal records are immutable, but the id may have been evicted and reused meanwhile.
        if (it == sh.records.end() || it->second.status == ExecutionStatus::Running ||
            it->second.end_time != end_time) {
            continue;
        }
        (it->second.status == ExecutionStatus::Completed ? completed_ : errored_).fetch_sub(1, std::memory_order_relaxed);
        sh.records.erase(it);
        ++res.evicted;
    }
    return res;
}

} // namespace vigil::exec

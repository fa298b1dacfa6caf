#pragma once
// vigil — MetricStore
// Concurrency Model: sharded index + per-entry locks.
//   • Keys hash to one of N shards; each shard's index is guarded by a shared_mutex.
//   • Lookups of existing keys take the shard lock shared; first-time inserts take it exclusive.
//   • Every entry carries its own mutex; updates and snapshot copies lock only that entry.
//   • Entries are never erased, so entry addresses and index keys stay valid for the
//     store's lifetime and can be read after the shard lock is released.
// summary() therefore blocks a writer for at most one entry copy (or one index scan of
// one shard); it is per-key atomic, not globally consistent.
// Observers are notified outside the entry lock, possibly out of apply order;
// Observation::seq restores that order.

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigil/config/constants.hpp"
#include "vigil/metrics/metric_types.hpp"
#include "vigil/obs/errors.hpp"
#include "vigil/util/clock.hpp"

namespace vigil::metrics {

class MetricStore final {
public:
    /**
     * @param clock Time source for `last_updated`.
     * @param observer Optional sink notified after each accepted record (non-owning).
     * @param reservoir_size Recent samples kept per timer for percentiles.
     */
    explicit MetricStore(const util::Clock& clock,
                         MetricObserver* observer = nullptr,
                         std::size_t reservoir_size = config::constants::TIMER_RESERVOIR_SIZE);

    MetricStore(const MetricStore&)            = delete;
    MetricStore& operator=(const MetricStore&) = delete;

    /**
     * @brief Record one value against `(name, labels)`.
     * @return InvalidArgument for an empty name, non-finite value, or a negative
     *         counter/timer value; KindMismatch if the key exists with another kind.
     */
    obs::Status record(std::string_view name, double value, const Labels& labels, MetricKind kind);

    /// Snapshot of every known key.
    [[nodiscard]] MetricsSummary summary() const;

    /// Snapshot of a single key, if it exists.
    [[nodiscard]] std::optional<MetricSnapshot> find(std::string_view name, const Labels& labels) const;

    /// Number of distinct keys.
    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Entry {
        Entry(std::string n, Labels l, MetricKind k, std::size_t reservoir)
            : name(std::move(n)), labels(std::move(l)), kind(k) { samples.reserve(reservoir); }

        const std::string name;
        const Labels      labels;
        const MetricKind  kind;

        mutable std::mutex mu;
        uint64_t count{0};
        double   sum{0.0}, min{0.0}, max{0.0}, last{0.0};
        util::Timestamp last_updated{};
        std::vector<double> samples; ///< Timer ring buffer
        std::size_t next_sample{0};
    };

    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct KeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    using Index = std::unordered_map<std::string, std::unique_ptr<Entry>, KeyHash, KeyEq>;

    struct Shard {
        mutable std::shared_mutex mu;
        Index index;
    };

    Shard& shard_for(std::string_view key) noexcept;
    const Shard& shard_for(std::string_view key) const noexcept;

    /// Find or insert; returns the (stable) entry and its canonical key.
    std::pair<Entry*, const std::string*> acquire(std::string key, std::string_view name,
                                                  const Labels& labels, MetricKind kind);

    void apply_locked(Entry& e, double value, util::Timestamp now) const noexcept;
    static MetricSnapshot snapshot_locked(const Entry& e);

    const util::Clock& clock_;
    MetricObserver*    observer_{nullptr};
    const std::size_t  reservoir_size_;
    std::atomic<uint64_t> next_seq_{0};
    std::array<Shard, config::constants::METRIC_SHARDS> shards_{};
};

} // namespace vigil::metrics

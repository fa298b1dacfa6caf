// MetricStore — Implementation Notes
// Write path: canonical key → shard → (shared lookup | exclusive insert) → entry lock.
// The observer is notified after the entry lock is released, with a copy of the
// aggregate taken under that lock, so alert evaluation never extends the entry's
// critical section.

#include "vigil/metrics/metric_store.hpp"

#include <algorithm>
#include <cmath>

namespace vigil::metrics {

std::string_view to_string(MetricKind k) noexcept {
    switch (k) {
        case MetricKind::Counter: return "counter";
        case MetricKind::Timer:   return "timer";
        case MetricKind::Gauge:   return "gauge";
    }
    return "unknown";
}

// Backslash-escapes the key delimiters so distinct (name, labels) pairs never share a key.
static void append_escaped(std::string& out, std::string_view s) {
    for (const char c : s) {
        if (c == '\\' || c == ',' || c == '=' || c == '{' || c == '}') out.push_back('\\');
        out.push_back(c);
    }
}

std::string canonical_key(std::string_view name, const Labels& labels) {
    std::string out;
    out.reserve(name.size() + 2);
    append_escaped(out, name);
    if (labels.empty()) return out;
    out.push_back('{');
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) out.push_back(',');
        first = false;
        append_escaped(out, k);
        out.push_back('=');
        append_escaped(out, v);
    }
    out.push_back('}');
    return out;
}

// Nearest-rank percentile over a sorted sample set.
static double percentile(const std::vector<double>& sorted, double p) noexcept {
    if (sorted.empty()) return 0.0;
    const auto rank = static_cast<std::size_t>(std::ceil(p * static_cast<double>(sorted.size())));
    const auto idx  = rank == 0 ? 0 : std::min(rank - 1, sorted.size() - 1);
    return sorted[idx];
}

MetricStore::MetricStore(const util::Clock& clock, MetricObserver* observer, std::size_t reservoir_size)
    : clock_(clock), observer_(observer), reservoir_size_(reservoir_size) {}

MetricStore::Shard& MetricStore::shard_for(std::string_view key) noexcept {
    return shards_[KeyHash{}(key) % shards_.size()];
}

const MetricStore::Shard& MetricStore::shard_for(std::string_view key) const noexcept {
    return shards_[KeyHash{}(key) % shards_.size()];
}

//------------------------------- Write path -----------------------------------

std::pair<MetricStore::Entry*, const std::string*>
MetricStore::acquire(std::string key, std::string_view name, const Labels& labels, MetricKind kind) {
    Shard& sh = shard_for(key);
    {
        std::shared_lock lk(sh.mu);
        auto it = sh.index.find(std::string_view{key});
        if (it != sh.index.end()) return {it->second.get(), &it->first};
    }
    std::unique_lock lk(sh.mu);
    // Another writer may have inserted between the two locks; try_emplace keeps theirs.
    auto [it, inserted] = sh.index.try_emplace(std::move(key), nullptr);
    if (inserted) {
        it->second = std::make_unique<Entry>(std::string(name), labels, kind,
                                             kind == MetricKind::Timer ? reservoir_size_ : 0);
    }
    return {it->second.get(), &it->first};
}

void MetricStore::apply_locked(Entry& e, double value, util::Timestamp now) const noexcept {
    if (e.count == 0) {
        e.min = e.max = value;
    } else {
        e.min = std::min(e.min, value);
        e.max = std::max(e.max, value);
    }
    ++e.count;
    e.last = value;
    e.last_updated = now;

    switch (e.kind) {
        case MetricKind::Counter:
        case MetricKind::Timer:
            e.sum += value;
            break;
        case MetricKind::Gauge:
            e.sum = value; // gauges carry no running sum
            break;
    }

    if (e.kind == MetricKind::Timer && reservoir_size_ > 0) {
        if (e.samples.size() < reservoir_size_) {
            e.samples.push_back(value);
        } else {
            e.samples[e.next_sample] = value;
        }
        e.next_sample = (e.next_sample + 1) % reservoir_size_;
    }
}

obs::Status MetricStore::record(std::string_view name, double value, const Labels& labels, MetricKind kind) {
    if (name.empty() || !std::isfinite(value)) {
        return vigil_detail::unexpected(obs::ObsErr::InvalidArgument);
    }
    if (kind != MetricKind::Gauge && value < 0.0) {
        return vigil_detail::unexpected(obs::ObsErr::InvalidArgument);
    }

    auto [entry, key] = acquire(canonical_key(name, labels), name, labels, kind);
    if (entry->kind != kind) {
        return vigil_detail::unexpected(obs::ObsErr::KindMismatch);
    }

    // Time and sequence are taken under the entry lock so both follow apply order.
    util::Timestamp now;
    uint64_t seq = 0;
    MetricSnapshot snap;
    {
        std::lock_guard lk(entry->mu);
        now = clock_.now();
        seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
        apply_locked(*entry, value, now);
        if (observer_) snap = snapshot_locked(*entry);
    }

    if (observer_) {
        observer_->on_metric(Observation{entry->name, *key, kind, value, snap, now, seq});
    }
    return {};
}

//------------------------------- Read path ------------------------------------

MetricSnapshot MetricStore::snapshot_locked(const Entry& e) {
    MetricSnapshot s;
    s.name = e.name;
    s.labels = e.labels;
    s.kind = e.kind;
    s.count = e.count;
    s.sum = e.sum;
    s.min = e.min;
    s.max = e.max;
    s.last = e.last;
    s.last_updated = e.last_updated;

    switch (e.kind) {
        case MetricKind::Counter: s.value = e.sum; break;
        case MetricKind::Gauge:   s.value = e.last; break;
        case MetricKind::Timer: {
            s.value = e.count ? e.sum / static_cast<double>(e.count) : 0.0;
            std::vector<double> sorted(e.samples);
            std::sort(sorted.begin(), sorted.end());
            s.p50 = percentile(sorted, 0.50);
            s.p95 = percentile(sorted, 0.95);
            s.p99 = percentile(sorted, 0.99);
            break;
        }
    }
    return s;
}

MetricsSummary MetricStore::summary() const {
    MetricsSummary out;
    std::vector<std::pair<const std::string*, const Entry*>> refs;
    for (const auto& sh : shards_) {
        refs.clear();
        {
            std::shared_lock lk(sh.mu);
            refs.reserve(sh.index.size());
            for (const auto& [k, e] : sh.index) refs.emplace_back(&k, e.get());
        }
        // Index lock released: entries and keys are never erased.
        for (const auto& [k, e] : refs) {
            std::lock_guard lk(e->mu);
            out.emplace(*k, snapshot_locked(*e));
        }
    }
    return out;
}

std::optional<MetricSnapshot> MetricStore::find(std::string_view name, const Labels& labels) const {
    const auto key = canonical_key(name, labels);
    const Shard& sh = shard_for(key);
    const Entry* e = nullptr;
    {
        std::shared_lock lk(sh.mu);
        auto it = sh.index.find(std::string_view{key});
        if (it == sh.index.end()) return std::nullopt;
        e = it->second.get();
    }
    std::lock_guard lk(e->mu);
    return snapshot_locked(*e);
}

std::size_t MetricStore::size() const noexcept {
    std::size_t n = 0;
    for (const auto& sh : shards_) {
        std::shared_lock lk(sh.mu);
        n += sh.index.size();
    }
    return n;
}

} // namespace vigil::metrics

#pragma once
/**
 * @file clock.hpp
 * @brief Pluggable time source shared by the tracker, alert engine and reporter.
 * @details Production code uses SystemClock; tests drive ManualClock explicitly.
 */

#include <atomic>
#include <chrono>

namespace vigil::util {

    using Timestamp = std::chrono::system_clock::time_point;
    using Duration  = std::chrono::system_clock::duration;

    class Clock {
    public:
        virtual ~Clock() = default;

        /// Current wall-clock time.
        virtual Timestamp now() const noexcept = 0;
    };

    /**
     * @class SystemClock
     * @brief Clock backed by std::chrono::system_clock.
     */
    class SystemClock final : public Clock {
    public:
        Timestamp now() const noexcept override { return std::chrono::system_clock::now(); }
    };

    /**
     * @class ManualClock
     * @brief Clock that only moves when told to. Thread-safe.
     */
    class ManualClock final : public Clock {
    public:
        explicit ManualClock(Timestamp start = Timestamp{std::chrono::hours(24 * 365 * 50)}) noexcept
            : ticks_(start.time_since_epoch().count()) {}

        Timestamp now() const noexcept override {
            return Timestamp{Duration{ticks_.load(std::memory_order_acquire)}};
        }

        /// Move time forward by @p d.
        void advance(Duration d) noexcept { ticks_.fetch_add(d.count(), std::memory_order_acq_rel); }

        /// Jump to an absolute point in time.
        void set(Timestamp t) noexcept { ticks_.store(t.time_since_epoch().count(), std::memory_order_release); }

    private:
        std::atomic<Duration::rep> ticks_;
    };

    /// Process-wide default clock (stateless, safe to share).
    const Clock& system_clock() noexcept;

    /// Milliseconds between two timestamps as a double.
    inline double elapsed_ms(Timestamp from, Timestamp to) noexcept {
        return std::chrono::duration<double, std::milli>(to - from).count();
    }

} // namespace vigil::util

/**
 * @file diagnostics.cpp
 * @brief spdlog-backed diagnostic channel.
 */
#include "vigil/obs/diagnostics.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vigil::obs {

    std::string_view to_string(DropReason r) noexcept {
        switch (r) {
            case DropReason::UnknownExecution:  return "unknown_execution";
            case DropReason::TerminalExecution: return "terminal_execution";
            case DropReason::InvalidArgument:   return "invalid_argument";
        }
        return "unknown";
    }

    std::shared_ptr<spdlog::logger> default_logger() {
        static const std::shared_ptr<spdlog::logger> shared = [] {
            if (auto existing = spdlog::get("vigil")) return existing;
            return spdlog::stderr_color_mt("vigil");
        }();
        return shared;
    }

    void fatal(std::string_view what) noexcept {
        auto lg = spdlog::get("vigil");
        if (!lg) lg = spdlog::default_logger();
        lg->critical("vigil invariant violated: {}", what);
        lg->flush();
        std::abort();
    }

    Diagnostics::Diagnostics(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : default_logger()) {}

    void Diagnostics::dropped(DropReason reason, std::string_view op, std::string_view execution_id) noexcept {
        switch (reason) {
            case DropReason::UnknownExecution:  unknown_.fetch_add(1, std::memory_order_relaxed); break;
            case DropReason::TerminalExecution: terminal_.fetch_add(1, std::memory_order_relaxed); break;
            case DropReason::InvalidArgument:   invalid_.fetch_add(1, std::memory_order_relaxed); break;
        }
        logger_->warn("{} dropped: {} (execution_id='{}')", op, to_string(reason), execution_id);
    }

    void Diagnostics::repaired_end(std::string_view execution_id, std::string_view what) noexcept {
        repaired_.fetch_add(1, std::memory_order_relaxed);
        logger_->warn("end_execution repaired: {} (execution_id='{}')", what, execution_id);
    }

    void Diagnostics::evicted(std::size_t n) noexcept {
        if (n == 0) return;
        evicted_.fetch_add(n, std::memory_order_relaxed);
        logger_->debug("evicted {} terminal execution(s)", n);
    }

    void Diagnostics::forced_stale(std::size_t n) noexcept {
        if (n == 0) return;
        stale_.fetch_add(n, std::memory_order_relaxed);
        logger_->warn("force-terminated {} stale execution(s)", n);
    }

    DiagnosticCounters Diagnostics::counters() const noexcept {
        DiagnosticCounters c;
        c.unknown_execution  = unknown_.load(std::memory_order_relaxed);
        c.terminal_execution = terminal_.load(std::memory_order_relaxed);
        c.invalid_argument   = invalid_.load(std::memory_order_relaxed);
        c.repaired_end       = repaired_.load(std::memory_order_relaxed);
        c.evicted            = evicted_.load(std::memory_order_relaxed);
        c.forced_stale       = stale_.load(std::memory_order_relaxed);
        return c;
    }

} // namespace vigil::obs

/**
 * @file execution_scope.cpp
 * @brief Implementation of ExecutionScope and CallTimer.
 */
#include "vigil/obs/execution_scope.hpp"

#include <utility>

#include "vigil/obs/monitor.hpp"

namespace vigil::obs {

//------------------------------- CallTimer ------------------------------------

CallTimer::CallTimer(Monitor& monitor, std::string execution_id, std::string name)
    : monitor_(&monitor),
      execution_id_(std::move(execution_id)),
      name_(std::move(name)),
      started_(std::chrono::steady_clock::now()) {}

CallTimer::CallTimer(CallTimer&& other) noexcept
    : monitor_(std::exchange(other.monitor_, nullptr)),
      execution_id_(std::move(other.execution_id_)),
      name_(std::move(other.name_)),
      started_(other.started_),
      success_(other.success_) {}

CallTimer::~CallTimer() { finish(success_); }

void CallTimer::finish(bool success) noexcept {
    if (!monitor_) return;
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started_;
    monitor_->record_function_call(execution_id_, name_, elapsed.count(), success);
    monitor_ = nullptr;
}

//------------------------------- ExecutionScope -------------------------------

vigil_detail::expected<ExecutionScope, ObsErr>
ExecutionScope::begin(Monitor& monitor, std::string execution_id, exec::Metadata metadata) {
    if (auto st = monitor.start_execution(execution_id, std::move(metadata)); !st) {
        return vigil_detail::unexpected(st.error());
    }
    return ExecutionScope(monitor, std::move(execution_id));
}

ExecutionScope::ExecutionScope(Monitor& monitor, std::string id) noexcept
    : monitor_(&monitor), id_(std::move(id)), open_(true) {}

ExecutionScope::ExecutionScope(ExecutionScope&& other) noexcept
    : monitor_(other.monitor_), id_(std::move(other.id_)), open_(std::exchange(other.open_, false)) {}

ExecutionScope::~ExecutionScope() {
    if (open_) fail("execution scope abandoned");
}

void ExecutionScope::complete() noexcept {
    if (!open_) return;
    open_ = false;
    monitor_->end_execution(id_, exec::ExecutionStatus::Completed);
}

void ExecutionScope::fail(std::string message) noexcept {
    if (!open_) return;
    open_ = false;
    monitor_->end_execution(id_, exec::ExecutionStatus::Error, std::move(message));
}

CallTimer ExecutionScope::time_call(std::string name) {
    return CallTimer(*monitor_, id_, std::move(name));
}

} // namespace vigil::obs

#pragma once
/**
 * @file execution_scope.hpp
 * @brief RAII helpers for request handlers: execution lifetime and sub-call timing.
 *
 * Usage:
 * @code
 *   auto scope = ExecutionScope::begin(monitor, "exec-42", {{"agent_id", "a1"}});
 *   if (!scope) return;                      // DuplicateExecution / InvalidArgument
 *   {
 *       auto t = scope->time_call("agent_manager.execute_agent");
 *       ...                                   // reported when t goes out of scope
 *   }
 *   scope->complete();                        // or scope->fail("reason")
 * @endcode
 * A scope that is destroyed without complete()/fail() ends its execution as Error.
 */

#include <chrono>
#include <string>

#include "vigil/compat/expected.hpp"
#include "vigil/exec/execution.hpp"
#include "vigil/obs/errors.hpp"

namespace vigil::obs {

class Monitor;

/** @class CallTimer
 *  @brief Measures one sub-call on a steady clock and reports it on finish/destruction.
 */
class CallTimer {
public:
    CallTimer(Monitor& monitor, std::string execution_id, std::string name);
    ~CallTimer();

    CallTimer(CallTimer&& other) noexcept;
    CallTimer(const CallTimer&)            = delete;
    CallTimer& operator=(const CallTimer&) = delete;
    CallTimer& operator=(CallTimer&&)      = delete;

    /// Report as failed when destroyed.
    void mark_failed() noexcept { success_ = false; }

    /// Report now with @p success; later calls and destruction are no-ops.
    void finish(bool success) noexcept;

private:
    Monitor* monitor_{nullptr};
    std::string execution_id_;
    std::string name_;
    std::chrono::steady_clock::time_point started_;
    bool success_{true};
};

/** @class ExecutionScope
 *  @brief Owns one execution from start to its terminal state.
 */
class ExecutionScope {
public:
    /**
     * @brief Factory: starts the execution; no scope is created on failure.
     * @return ExecutionScope or the start_execution error.
     */
    static vigil_detail::expected<ExecutionScope, ObsErr>
    begin(Monitor& monitor, std::string execution_id, exec::Metadata metadata = {});

    ~ExecutionScope();

    ExecutionScope(ExecutionScope&& other) noexcept;
    ExecutionScope(const ExecutionScope&)            = delete;
    ExecutionScope& operator=(const ExecutionScope&) = delete;
    ExecutionScope& operator=(ExecutionScope&&)      = delete;

    /// End as Completed.
    void complete() noexcept;

    /// End as Error with @p message.
    void fail(std::string message) noexcept;

    /// Start timing a sub-call of this execution. After complete()/fail() the
    /// timer's report is dropped by the tracker like any late call.
    [[nodiscard]] CallTimer time_call(std::string name);

    const std::string& id() const noexcept { return id_; }
    bool finished() const noexcept { return !open_; }

private:
    ExecutionScope(Monitor& monitor, std::string id) noexcept;

    Monitor* monitor_{nullptr};
    std::string id_;
    bool open_{false}; ///< Still owes an end_execution
};

} // namespace vigil::obs

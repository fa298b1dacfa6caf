/**
 * @file execution.hpp
 * @brief Execution record model shared by the tracker, the reporter and the host.
 *
 * An execution is one logical unit of instrumented work (one agent request).
 * Its call log is append-only and ordered by call order; status moves from
 * Running to exactly one terminal state.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "vigil/util/clock.hpp"

namespace vigil::exec {

/**
 * @brief Lifecycle state of an execution.
 *
 * @note Transitions: Running → Completed, Running → Error. Both terminal.
 */
enum class ExecutionStatus : std::uint8_t {
  Running = 0,
  Completed = 1,
  Error = 2
};

std::string_view to_string(ExecutionStatus s) noexcept;

/// Opaque metadata value captured at start (agent id, input size, flags...).
using MetadataValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

/// Metadata captured at start; ordered for stable reports.
using Metadata = std::map<std::string, MetadataValue>;

/**
 * @brief One timed sub-step within an execution.
 */
struct FunctionCall final {
  /// Sub-call name, e.g. "voice_service.synthesize_speech".
  std::string name;

  /// Measured duration in milliseconds.
  double duration_ms{0.0};

  /// Whether the sub-call succeeded.
  bool success{true};

  /// When the tracker accepted the record.
  util::Timestamp recorded_at{};

  bool operator==(const FunctionCall&) const = default;
};

/**
 * @brief Read-side copy of an execution, returned by performance report queries.
 */
struct ExecutionReport final {
  std::string execution_id;
  Metadata metadata;
  ExecutionStatus status{ExecutionStatus::Running};
  util::Timestamp start_time{};
  std::optional<util::Timestamp> end_time;   ///< Unset while running
  std::optional<std::string> error_message;  ///< Set iff status == Error

  /// end_time - start_time when terminal; elapsed-so-far while running.
  double total_duration_ms{0.0};

  /// Ordered call log.
  std::vector<FunctionCall> calls;

  std::size_t failed_calls{0};   ///< Calls with success == false
  double call_time_ms{0.0};      ///< Sum of call durations

  bool operator==(const ExecutionReport&) const = default;
};

/**
 * @brief Retained executions by status.
 */
struct ExecutionCounts final {
  std::size_t running{0};
  std::size_t completed{0};
  std::size_t error{0};

  bool operator==(const ExecutionCounts&) const = default;
};

} // namespace vigil::exec

#pragma once
/**
 * @file errors.hpp
 * @brief Error codes surfaced by the monitoring core.
 * @details Only caller bugs are surfaced. Best-effort recording paths never
 *          return these; they report to Diagnostics instead. Lookups of unknown
 *          or evicted entities are a normal negative result (std::nullopt).
 */

#include <cstdint>
#include <string_view>

#include "vigil/compat/expected.hpp"

namespace vigil::obs {

/// Result codes for surfaced failures.
enum class ObsErr : std::uint8_t {
    DuplicateExecution = 1, ///< start_execution on an id that is still retained
    KindMismatch,           ///< metric key already exists with another kind
    InvalidArgument         ///< empty name/id, non-finite or negative value
};

/// Result alias for operations without a payload.
using Status = vigil_detail::expected<void, ObsErr>;

/// Stable lower-case name for logs and host responses.
constexpr std::string_view to_string(ObsErr e) noexcept {
    switch (e) {
        case ObsErr::DuplicateExecution: return "duplicate_execution";
        case ObsErr::KindMismatch:       return "kind_mismatch";
        case ObsErr::InvalidArgument:    return "invalid_argument";
    }
    return "unknown";
}

} // namespace vigil::obs

#pragma once

#include <gigdispatch/core/types.hpp>

#include <optional>
#include <stop_token>

namespace gigdispatch::core {

class Clock;

/// @brief Caller-owned cancellation and deadline budget.
///
/// Passed through every engine operation into every collaborator call.
/// The engine checks it between phases; collaborators may check it while
/// they wait on I/O. A default-constructed context never expires.
///
/// @ingroup core
struct CallContext {
    std::stop_token stop;               ///< Cancelled when a stop is requested.
    std::optional<TimePoint> deadline;  ///< Absolute deadline, if any.

    /// @brief True when a stop was requested or the deadline has passed.
    [[nodiscard]] bool cancelled(const Clock& clock) const;

    /// @brief Throw CancelledError when cancelled().
    /// @param clock  Time source used for the deadline comparison.
    /// @param where  Name of the phase, included in the message.
    /// @throws CancelledError
    void check(const Clock& clock, const char* where) const;
};

} // namespace gigdispatch::core

#pragma once

#include <gigdispatch/core/types.hpp>

#include <atomic>
#include <cstdint>

namespace gigdispatch::core {

/// @brief Source of wall-clock time for the dispatch engine.
///
/// Offer timestamps, expiry checks, heartbeats and trace records all read
/// the time through a Clock so that hosts and tests control it.
///
/// @see SystemClock, ManualClock
/// @ingroup core
class Clock {
public:
    virtual ~Clock() = default;

    /// @brief Current time. Must be safe to call from any thread.
    [[nodiscard]] virtual TimePoint now() const = 0;

protected:
    Clock() = default;
    Clock(const Clock&) = default;
    Clock& operator=(const Clock&) = default;
    Clock(Clock&&) = default;
    Clock& operator=(Clock&&) = default;
};

/// @brief Clock backed by std::chrono::system_clock.
/// @ingroup core
class SystemClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
};

/// @brief Clock that only moves when told to.
///
/// Used by tests and by the simulator to make offer expiry deterministic.
/// Reads and writes are atomic, so worker threads may observe it.
/// @ingroup core
class ManualClock final : public Clock {
public:
    /// @brief Start at @p start (the Unix epoch by default).
    explicit ManualClock(TimePoint start = TimePoint::epoch()) noexcept;

    [[nodiscard]] TimePoint now() const override;

    /// @brief Move the clock forward by @p d.
    void advance(Duration d) noexcept;

    /// @brief Jump to @p t.
    void set(TimePoint t) noexcept;

private:
    std::atomic<int64_t> ns_;
};

} // namespace gigdispatch::core

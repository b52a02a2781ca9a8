#pragma once

#include <compare>
#include <cstdint>

namespace gigdispatch::core {

/// @brief Identifier of a gig worker (assigned by the worker-profile service).
using WorkerId = uint64_t;

/// @brief Identifier of a task (assigned by the upstream order service).
using TaskId = uint64_t;

/// @brief Identifier of a task offer (assigned by the offer repository).
using OfferId = uint64_t;

/// @brief Time interval represented as an integer nanosecond count.
///
/// Duration wraps an `int64_t` nanosecond value with a private constructor.
/// All construction goes through named factories, so conversions between
/// seconds (double) and nanoseconds (int64_t) are always explicit.
///
/// @see duration_from_seconds, duration_from_nanoseconds, TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    // Round double seconds to nearest nanosecond
    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ns_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute wall-clock time as a Duration offset from the Unix epoch.
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added.
///
/// @see time_from_seconds, time_to_seconds, Clock
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: the Unix epoch.
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since the epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Strong type for an amount of money in minor currency units.
///
/// Earnings and cash-on-delivery amounts are integral (kobo, cents) so that
/// sums never accumulate rounding error.
/// @ingroup core_types
struct Money {
    int64_t minor{0}; ///< Amount in minor units (1/100 of the currency unit).

    constexpr bool operator==(const Money&) const = default;
    constexpr auto operator<=>(const Money&) const = default;

    constexpr Money operator+(Money rhs) const noexcept {
        return Money{minor + rhs.minor};
    }

    constexpr Money& operator+=(Money rhs) noexcept {
        minor += rhs.minor;
        return *this;
    }

    /// @brief True when the amount is strictly greater than zero.
    [[nodiscard]] constexpr bool is_positive() const noexcept { return minor > 0; }
};

/// @brief WGS-84 coordinate in decimal degrees.
/// @ingroup core_types
struct GeoPoint {
    double latitude{0.0};  ///< Latitude in [-90, 90].
    double longitude{0.0}; ///< Longitude in [-180, 180].

    constexpr bool operator==(const GeoPoint&) const = default;

    /// @brief True when both components are inside their valid ranges.
    [[nodiscard]] constexpr bool valid() const noexcept {
        return latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a TimePoint from seconds since the Unix epoch.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Create a TimePoint from nanoseconds since the Unix epoch.
[[nodiscard]] constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept {
    return TimePoint{duration_from_nanoseconds(ns)};
}

/// @brief Convert a TimePoint to seconds since the Unix epoch (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

} // namespace gigdispatch::core

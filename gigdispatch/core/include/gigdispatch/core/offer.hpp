#pragma once

#include <gigdispatch/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gigdispatch::core {

/// @brief Offer status. Every state other than Pending is terminal.
/// @ingroup core_model
enum class OfferStatus {
    Pending,
    Accepted,
    Declined,
    Expired,
    Cancelled
};

/// @brief A time-boxed proposal of a task to one worker.
///
/// Created exclusively by the strategy executor. The id is assigned by the
/// offer repository when the offer is persisted.
///
/// @see OfferRepository
/// @ingroup core_model
struct TaskOffer {
    OfferId id{0};
    TaskId task_id{0};
    WorkerId worker_id{0};
    TimePoint offered_at;
    TimePoint expires_at;
    OfferStatus status{OfferStatus::Pending};
    Money base_earning{};
    Money bonus_earning{};
    int estimated_minutes{0};
    double distance_km{0.0};
    std::optional<TimePoint> responded_at;
    std::optional<std::string> decline_reason;

    /// @brief True once @p now is strictly past expires_at.
    ///
    /// Independent of the stored status: a pending offer whose expiry has
    /// passed can no longer be accepted.
    [[nodiscard]] bool is_expired_at(TimePoint now) const noexcept {
        return now > expires_at;
    }

    /// @brief True while pending and not yet expired at @p now.
    [[nodiscard]] bool is_active_at(TimePoint now) const noexcept {
        return status == OfferStatus::Pending && !is_expired_at(now);
    }
};

[[nodiscard]] constexpr bool is_terminal(OfferStatus status) noexcept {
    return status != OfferStatus::Pending;
}

[[nodiscard]] std::string_view to_string(OfferStatus status) noexcept;
[[nodiscard]] std::optional<OfferStatus> parse_offer_status(std::string_view name);

} // namespace gigdispatch::core

#pragma once

#include <cstddef>

namespace gigdispatch::algo {

/// @brief Tunables of the allocation engine.
///
/// Defaults are usable as-is. Field names match the JSON keys read by
/// io::load_config().
///
/// @see validate_config, io::load_config
/// @ingroup algo
struct AllocationConfig {
    // -- Offers --------------------------------------------------------------

    double offer_timeout_seconds{30.0};  ///< Lifetime of an offer.
    std::size_t max_concurrent_offers{5};  ///< Broadcast fan-out limit per task.

    // -- Scoring weights (configured profile) --------------------------------

    double distance_weight{0.30};
    double rating_weight{0.20};
    double experience_weight{0.10};
    double acceptance_rate_weight{0.15};
    double on_time_rate_weight{0.15};
    double load_balance_weight{0.10};

    // -- Constraints ---------------------------------------------------------

    double max_worker_distance_km{10.0};  ///< Search radius and hard distance limit.
    double min_worker_rating{3.5};        ///< Rating floor for eligibility.
    std::size_t max_tasks_per_worker{3};  ///< Denominator of the load-balance score.

    // -- Extensions ----------------------------------------------------------

    bool enable_ai_optimization{false};   ///< Reserved; AIOptimized falls back to Nearest.
    double heartbeat_timeout_seconds{120.0};  ///< Age after which a worker is flipped offline.
};

/// @brief Check that @p config is usable.
///
/// @throws ConfigError naming the first offending field: non-positive
///         timeouts, distance or limits, a negative weight, or a rating
///         floor outside [0, 5].
void validate_config(const AllocationConfig& config);

} // namespace gigdispatch::algo

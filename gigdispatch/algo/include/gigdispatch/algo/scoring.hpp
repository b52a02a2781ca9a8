#pragma once

#include <gigdispatch/algo/candidate.hpp>
#include <gigdispatch/algo/config.hpp>

#include <vector>

namespace gigdispatch::algo {

/// @brief Weights applied to a ScoreBreakdown to obtain the total score.
/// @ingroup algo_scoring
struct WeightProfile {
    double distance{0.0};
    double rating{0.0};
    double experience{0.0};
    double acceptance{0.0};
    double on_time{0.0};
    double load_balance{0.0};
};

/// @brief Distance-first profile used by the Nearest strategy.
///
/// distance 0.5, rating 0.2, acceptance 0.15, on-time 0.15.
[[nodiscard]] constexpr WeightProfile nearest_profile() noexcept {
    return WeightProfile{.distance = 0.5,
                         .rating = 0.2,
                         .experience = 0.0,
                         .acceptance = 0.15,
                         .on_time = 0.15,
                         .load_balance = 0.0};
}

/// @brief The six configured weights of @p config.
[[nodiscard]] WeightProfile configured_profile(const AllocationConfig& config) noexcept;

/// @brief Compute the normalised sub-scores of @p candidate.
///
/// - distance:     100 * (1 - min(distance / max_worker_distance, 1))
/// - rating:       rating * 20
/// - experience:   min(100, ln(completed + 1) * 20)
/// - acceptance:   acceptance_rate * 100
/// - on_time:      on_time_rate * 100
/// - load_balance: 100 * (1 - active / max_tasks_per_worker), clamped to [0, 100]
[[nodiscard]] ScoreBreakdown score_components(const Candidate& candidate,
                                              const AllocationConfig& config);

/// @brief Weighted sum of @p breakdown under @p weights.
[[nodiscard]] double weighted_score(const ScoreBreakdown& breakdown,
                                    const WeightProfile& weights) noexcept;

/// @brief Score every candidate and sort them best first.
///
/// Candidates with equal total score are ordered by ascending worker id so
/// the ranking is reproducible.
void rank_candidates(std::vector<Candidate>& candidates, const WeightProfile& weights,
                     const AllocationConfig& config);

} // namespace gigdispatch::algo

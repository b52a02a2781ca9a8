#include <gigdispatch/algo/scoring.hpp>

#include <algorithm>
#include <cmath>

namespace gigdispatch::algo {

WeightProfile configured_profile(const AllocationConfig& config) noexcept {
    return WeightProfile{.distance = config.distance_weight,
                         .rating = config.rating_weight,
                         .experience = config.experience_weight,
                         .acceptance = config.acceptance_rate_weight,
                         .on_time = config.on_time_rate_weight,
                         .load_balance = config.load_balance_weight};
}

ScoreBreakdown score_components(const Candidate& candidate, const AllocationConfig& config) {
    const auto& worker = candidate.worker;
    ScoreBreakdown breakdown;

    breakdown.distance =
        100.0 * (1.0 - std::min(candidate.distance_km / config.max_worker_distance_km, 1.0));
    breakdown.rating = worker.rating * 20.0;
    breakdown.experience =
        std::min(100.0, std::log(static_cast<double>(worker.completed_tasks) + 1.0) * 20.0);
    breakdown.acceptance = worker.acceptance_rate * 100.0;
    breakdown.on_time = worker.on_time_rate * 100.0;

    double load = static_cast<double>(candidate.state.active_task_count) /
                  static_cast<double>(config.max_tasks_per_worker);
    breakdown.load_balance = std::clamp(100.0 * (1.0 - load), 0.0, 100.0);

    return breakdown;
}

double weighted_score(const ScoreBreakdown& breakdown, const WeightProfile& weights) noexcept {
    return breakdown.distance * weights.distance +
           breakdown.rating * weights.rating +
           breakdown.experience * weights.experience +
           breakdown.acceptance * weights.acceptance +
           breakdown.on_time * weights.on_time +
           breakdown.load_balance * weights.load_balance;
}

void rank_candidates(std::vector<Candidate>& candidates, const WeightProfile& weights,
                     const AllocationConfig& config) {
    for (auto& candidate : candidates) {
        candidate.breakdown = score_components(candidate, config);
        candidate.score = weighted_score(candidate.breakdown, weights);
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& lhs, const Candidate& rhs) {
                  if (lhs.score != rhs.score) {
                      return lhs.score > rhs.score;
                  }
                  return lhs.worker.id < rhs.worker.id;
              });
}

} // namespace gigdispatch::algo

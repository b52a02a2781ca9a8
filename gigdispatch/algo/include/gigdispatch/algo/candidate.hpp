#pragma once

#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/worker.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

namespace gigdispatch::algo {

/// @brief Per-factor suitability scores, each normalised to [0, 100].
/// @ingroup algo_scoring
struct ScoreBreakdown {
    double distance{0.0};
    double rating{0.0};
    double experience{0.0};
    double acceptance{0.0};
    double on_time{0.0};
    double load_balance{0.0};
};

/// @brief A worker that survived eligibility filtering for one task.
///
/// Carries a snapshot of the worker's live state taken during discovery so
/// that scoring never has to go back to the registry.
///
/// @see CandidateDiscovery, rank_candidates
/// @ingroup algo
struct Candidate {
    core::GigWorker worker;
    core::WorkerState state;
    double distance_km{0.0};
    int eta_minutes{0};
    core::EarningBreakdown earning;
    double score{0.0};
    ScoreBreakdown breakdown;
};

} // namespace gigdispatch::algo

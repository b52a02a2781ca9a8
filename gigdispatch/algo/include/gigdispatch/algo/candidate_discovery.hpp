#pragma once

#include <gigdispatch/algo/candidate.hpp>
#include <gigdispatch/algo/config.hpp>

#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/tracer.hpp>
#include <gigdispatch/core/worker.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gigdispatch::algo {

/// @brief Deliveries heavier than this need a driver.
inline constexpr double HEAVY_DELIVERY_KG = 50.0;

/// @brief Deliveries heavier than this (and not heavy) need a driver or rider.
inline constexpr double MEDIUM_DELIVERY_KG = 10.0;

/// @brief Minutes per kilometre used when the geo service cannot produce an ETA.
inline constexpr int FALLBACK_MINUTES_PER_KM = 3;

/// @brief Worker types able to perform @p task.
///
/// | Task          | Weight       | Types                      |
/// |---------------|--------------|----------------------------|
/// | delivery      | > 50 kg      | driver                     |
/// | delivery      | > 10 kg      | driver, rider              |
/// | delivery      | otherwise    | driver, rider, cyclist     |
/// | collection    |              | collector, driver, rider   |
/// | survey        |              | surveyor, walker           |
/// | merchandising |              | merchandiser, walker       |
///
/// @ingroup algo_discovery
[[nodiscard]] std::vector<core::WorkerType> required_worker_types(const core::Task& task);

/// @brief Check the profile-level hard constraints of @p worker against @p task.
///
/// Covers status, verification, rating floor, preferred task types, vehicle
/// capacity and cash-on-delivery. Live state and distance are checked
/// separately by CandidateDiscovery.
///
/// @return std::nullopt if eligible, otherwise a short rejection reason.
/// @ingroup algo_discovery
[[nodiscard]] std::optional<std::string_view> check_eligibility(const core::GigWorker& worker,
                                                                const core::Task& task,
                                                                const AllocationConfig& config);

/// @brief Finds and enriches the eligible workers for one task.
///
/// For each worker the repository returns, discovery applies the hard
/// constraints, requires an online registry entry, measures the distance
/// from the worker's live location to the task, estimates the ETA and asks
/// the pricing collaborator for an earning estimate. Every rejection is
/// traced as `candidate_rejected` with its reason.
///
/// A failure of the worker repository aborts discovery with
/// core::CollaboratorError. ETA failures fall back to
/// FALLBACK_MINUTES_PER_KM per kilometre and earning failures exclude only the
/// affected worker.
///
/// @ingroup algo_discovery
class CandidateDiscovery {
public:
    CandidateDiscovery(const AllocationConfig& config, const core::Clock& clock,
                       core::Tracer& tracer, core::WorkerStateRegistry& registry,
                       core::WorkerRepository& workers, core::GeoService& geo,
                       core::EarningCalculator& earnings);

    /// @brief Eligible candidates for @p task, unranked. May be empty.
    /// @param exclude  Workers that must not be considered (e.g. they already
    ///                 hold an offer for this task).
    [[nodiscard]] std::vector<Candidate> discover(const core::CallContext& ctx,
                                                  const core::Task& task,
                                                  const std::unordered_set<core::WorkerId>& exclude = {});

private:
    void reject(const core::Task& task, core::WorkerId worker_id, std::string_view reason);

    const AllocationConfig& config_;
    const core::Clock& clock_;
    core::Tracer& tracer_;
    core::WorkerStateRegistry& registry_;
    core::WorkerRepository& workers_;
    core::GeoService& geo_;
    core::EarningCalculator& earnings_;
};

} // namespace gigdispatch::algo

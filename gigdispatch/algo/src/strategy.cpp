#include <gigdispatch/algo/strategy.hpp>

#include <gigdispatch/algo/task_group.hpp>

#include <gigdispatch/core/error.hpp>

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace gigdispatch::algo {

namespace {

WeightProfile nearest_weights(const AllocationConfig& /*config*/) {
    return nearest_profile();
}

WeightProfile configured_weights(const AllocationConfig& config) {
    return configured_profile(config);
}

constexpr std::array<StrategyEntry, 3> STRATEGIES{{
    {Strategy::Nearest, "nearest", &nearest_weights, &execute_nearest},
    {Strategy::Broadcast, "broadcast", &configured_weights, &execute_broadcast},
    {Strategy::AIOptimized, "ai_optimized", &configured_weights, &execute_ai_optimized},
}};

constexpr std::array<std::pair<AllocationFailure, std::string_view>, 2> FAILURE_NAMES{{
    {AllocationFailure::NoEligibleWorkers, "no_eligible_workers"},
    {AllocationFailure::OfferCreationFailed, "offer_creation_failed"},
}};

void require_candidates(const core::Task& task, std::span<const Candidate> candidates) {
    if (candidates.empty()) {
        throw core::NoEligibleWorkersError("no eligible workers for task " + std::to_string(task.id));
    }
}

} // namespace

std::string_view to_string(Strategy strategy) noexcept {
    return strategy_entry(strategy).name;
}

std::optional<Strategy> parse_strategy(std::string_view name) {
    for (const auto& entry : STRATEGIES) {
        if (entry.name == name) {
            return entry.tag;
        }
    }
    return std::nullopt;
}

std::string_view to_string(AllocationFailure failure) noexcept {
    for (const auto& [key, name] : FAILURE_NAMES) {
        if (key == failure) {
            return name;
        }
    }
    return "unknown";
}

const StrategyEntry& strategy_entry(Strategy strategy) noexcept {
    for (const auto& entry : STRATEGIES) {
        if (entry.tag == strategy) {
            return entry;
        }
    }
    return STRATEGIES.front();
}

AllocationResult execute_nearest(const StrategyContext& ctx, const core::Task& task,
                                 std::span<const Candidate> candidates) {
    require_candidates(task, candidates);

    const Candidate& best = candidates.front();

    AllocationResult result;
    result.task_id = task.id;
    result.strategy = Strategy::Nearest;
    result.offers_attempted = 1;

    auto offer = ctx.dispatcher.dispatch(ctx.call, task, best);
    if (!offer) {
        result.failure = AllocationFailure::OfferCreationFailed;
        result.message = "failed to create offer";
        return result;
    }

    ctx.dispatcher.mark_offered(ctx.call, task);

    result.success = true;
    result.offers_created = 1;
    result.worker_ids.push_back(best.worker.id);
    result.offer_ids.push_back(offer->id);
    result.earning = best.earning;
    result.message = "offered to worker " + std::to_string(best.worker.id);
    return result;
}

AllocationResult execute_broadcast(const StrategyContext& ctx, const core::Task& task,
                                   std::span<const Candidate> candidates) {
    require_candidates(task, candidates);

    const std::size_t limit = std::max<std::size_t>(ctx.fan_out, 1);
    const auto selected = candidates.first(std::min(limit, candidates.size()));

    // One slot per selected candidate; slots are written by exactly one unit
    std::vector<std::optional<core::TaskOffer>> outcomes(selected.size());
    {
        TaskGroup group(selected.size());
        for (std::size_t i = 0; i < selected.size(); ++i) {
            auto unit = [&, i] {
                outcomes[i] = ctx.dispatcher.dispatch(ctx.call, task, selected[i]);
            };
            try {
                group.spawn(unit);
            } catch (const std::system_error&) {
                // Out of threads: offer on the calling thread instead
                unit();
            }
        }
        group.wait();
    }

    AllocationResult result;
    result.task_id = task.id;
    result.strategy = Strategy::Broadcast;
    result.offers_attempted = selected.size();

    for (std::size_t i = 0; i < selected.size(); ++i) {
        if (outcomes[i]) {
            result.worker_ids.push_back(selected[i].worker.id);
            result.offer_ids.push_back(outcomes[i]->id);
        }
    }
    result.offers_created = result.offer_ids.size();

    if (result.offers_created == 0) {
        result.failure = AllocationFailure::OfferCreationFailed;
        result.message = "failed to create any offer";
        return result;
    }

    ctx.dispatcher.mark_offered(ctx.call, task);

    result.success = true;
    result.message = "broadcast to " + std::to_string(result.offers_created) + " of " +
                     std::to_string(result.offers_attempted) + " workers";
    return result;
}

AllocationResult execute_ai_optimized(const StrategyContext& ctx, const core::Task& task,
                                      std::span<const Candidate> candidates) {
    // Model-driven selection is not wired in; both flag states run Nearest
    AllocationResult result = execute_nearest(ctx, task, candidates);
    result.strategy = Strategy::AIOptimized;
    return result;
}

} // namespace gigdispatch::algo

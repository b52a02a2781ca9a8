#pragma once

#include <gigdispatch/algo/candidate.hpp>
#include <gigdispatch/algo/config.hpp>
#include <gigdispatch/algo/offer_dispatcher.hpp>
#include <gigdispatch/algo/scoring.hpp>

#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/task.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gigdispatch::algo {

/// @brief Allocation strategies understood by the engine.
/// @ingroup algo_strategy
enum class Strategy {
    Nearest,      ///< One offer to the best-ranked candidate.
    Broadcast,    ///< Concurrent offers to the top candidates.
    AIOptimized   ///< Reserved extension point; currently runs Nearest.
};

[[nodiscard]] std::string_view to_string(Strategy strategy) noexcept;
[[nodiscard]] std::optional<Strategy> parse_strategy(std::string_view name);

/// @brief Why an allocation produced no offer.
/// @ingroup algo_strategy
enum class AllocationFailure {
    NoEligibleWorkers,   ///< Discovery returned no candidate.
    OfferCreationFailed  ///< Every offer creation attempt failed.
};

[[nodiscard]] std::string_view to_string(AllocationFailure failure) noexcept;

/// @brief Outcome of one AllocateTask call.
///
/// A broadcast that created fewer offers than it attempted but at least one
/// is still a success; partial() reports that case.
/// @ingroup algo_strategy
struct AllocationResult {
    bool success{false};
    core::TaskId task_id{0};
    Strategy strategy{Strategy::Nearest};       ///< Strategy requested by the caller.
    std::vector<core::WorkerId> worker_ids;     ///< Workers that received an offer.
    std::vector<core::OfferId> offer_ids;       ///< Offers created, parallel to worker_ids.
    std::size_t offers_attempted{0};
    std::size_t offers_created{0};
    std::optional<core::EarningBreakdown> earning;  ///< Estimate of the top offer (Nearest).
    std::optional<AllocationFailure> failure;
    std::string message;

    [[nodiscard]] bool partial() const noexcept {
        return offers_created > 0 && offers_created < offers_attempted;
    }
};

/// @brief What a strategy function may use while executing.
/// @ingroup algo_strategy
struct StrategyContext {
    const core::CallContext& call;
    const AllocationConfig& config;
    OfferDispatcher& dispatcher;
    std::size_t fan_out;  ///< Broadcast limit for this call (at least 1).
};

/// @brief Signature shared by every strategy.
///
/// @p candidates are already ranked, best first.
/// @throws core::NoEligibleWorkersError if @p candidates is empty.
using StrategyFn = AllocationResult (*)(const StrategyContext& ctx, const core::Task& task,
                                        std::span<const Candidate> candidates);

/// @brief Row of the strategy table.
/// @ingroup algo_strategy
struct StrategyEntry {
    Strategy tag;
    std::string_view name;
    WeightProfile (*weights)(const AllocationConfig& config);
    StrategyFn execute;
};

/// @brief Table row for @p strategy.
[[nodiscard]] const StrategyEntry& strategy_entry(Strategy strategy) noexcept;

/// @brief Offer the task to the top candidate only.
AllocationResult execute_nearest(const StrategyContext& ctx, const core::Task& task,
                                 std::span<const Candidate> candidates);

/// @brief Offer the task to up to @c ctx.fan_out top candidates concurrently.
///
/// Offer creation and notification for each selected candidate run in a
/// TaskGroup bounded by the fan-out; the call returns only after every
/// attempt finished. Succeeds iff at least one offer was created.
AllocationResult execute_broadcast(const StrategyContext& ctx, const core::Task& task,
                                   std::span<const Candidate> candidates);

/// @brief Reserved for model-driven selection; delegates to execute_nearest().
AllocationResult execute_ai_optimized(const StrategyContext& ctx, const core::Task& task,
                                      std::span<const Candidate> candidates);

} // namespace gigdispatch::algo

#pragma once

#include <gigdispatch/algo/candidate.hpp>
#include <gigdispatch/algo/config.hpp>

#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/offer.hpp>
#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/tracer.hpp>

#include <optional>

namespace gigdispatch::algo {

/// @brief Creates, persists and announces individual offers.
///
/// Shared by every strategy. dispatch() is safe to call from several threads
/// at once as long as the collaborators are.
///
/// Failure policy:
/// - offer creation fails: traced as `offer_create_failed`, nothing persisted,
///   dispatch() returns std::nullopt;
/// - notification fails: traced as `offer_notify_failed`, the offer stays
///   persisted and is returned;
/// - the task status update fails: traced as `task_status_failed`, persisted
///   offers are kept.
///
/// @ingroup algo_strategy
class OfferDispatcher {
public:
    OfferDispatcher(const AllocationConfig& config, const core::Clock& clock, core::Tracer& tracer,
                    core::OfferRepository& offers, core::TaskRepository& tasks,
                    core::WorkerNotifier& notifier);

    /// @brief Offer @p task to @p candidate.
    /// @return The persisted offer, or std::nullopt if it could not be created.
    std::optional<core::TaskOffer> dispatch(const core::CallContext& ctx, const core::Task& task,
                                            const Candidate& candidate);

    /// @brief Move @p task to Offered after at least one offer was created.
    void mark_offered(const core::CallContext& ctx, const core::Task& task);

private:
    const AllocationConfig& config_;
    const core::Clock& clock_;
    core::Tracer& tracer_;
    core::OfferRepository& offers_;
    core::TaskRepository& tasks_;
    core::WorkerNotifier& notifier_;
};

} // namespace gigdispatch::algo

#include <gigdispatch/algo/offer_dispatcher.hpp>

#include <exception>
#include <string_view>

namespace gigdispatch::algo {

OfferDispatcher::OfferDispatcher(const AllocationConfig& config, const core::Clock& clock,
                                 core::Tracer& tracer, core::OfferRepository& offers,
                                 core::TaskRepository& tasks, core::WorkerNotifier& notifier)
    : config_(config)
    , clock_(clock)
    , tracer_(tracer)
    , offers_(offers)
    , tasks_(tasks)
    , notifier_(notifier) {}

std::optional<core::TaskOffer> OfferDispatcher::dispatch(const core::CallContext& ctx,
                                                         const core::Task& task,
                                                         const Candidate& candidate) {
    const core::TimePoint now = clock_.now();

    core::TaskOffer offer;
    offer.task_id = task.id;
    offer.worker_id = candidate.worker.id;
    offer.offered_at = now;
    offer.expires_at = now + core::duration_from_seconds(config_.offer_timeout_seconds);
    offer.status = core::OfferStatus::Pending;
    offer.base_earning = candidate.earning.base;
    offer.bonus_earning = candidate.earning.bonus;
    offer.estimated_minutes = candidate.eta_minutes;
    offer.distance_km = candidate.distance_km;

    try {
        offer.id = offers_.create(ctx, offer);
    } catch (const std::exception& e) {
        tracer_.emit("offer_create_failed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task.id));
            w.field("worker_id", static_cast<uint64_t>(candidate.worker.id));
            w.field("error", std::string_view{e.what()});
        });
        return std::nullopt;
    }

    tracer_.emit("offer_created", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task.id));
        w.field("offer_id", static_cast<uint64_t>(offer.id));
        w.field("worker_id", static_cast<uint64_t>(offer.worker_id));
        w.field("score", candidate.score);
        w.field("distance_km", offer.distance_km);
        w.field("expires_at", core::time_to_seconds(offer.expires_at));
    });

    // The offer is persisted from here on; delivery problems never undo it
    try {
        notifier_.push_offer(ctx, offer.worker_id, offer, task);
    } catch (const std::exception& e) {
        tracer_.emit("offer_notify_failed", [&](core::TraceWriter& w) {
            w.field("offer_id", static_cast<uint64_t>(offer.id));
            w.field("worker_id", static_cast<uint64_t>(offer.worker_id));
            w.field("error", std::string_view{e.what()});
        });
    }

    return offer;
}

void OfferDispatcher::mark_offered(const core::CallContext& ctx, const core::Task& task) {
    try {
        // Conditional so a fast acceptance is never overwritten
        if (task.status != core::TaskStatus::Pending ||
            !tasks_.update_status(ctx, task.id, core::TaskStatus::Pending, core::TaskStatus::Offered)) {
            return;
        }
    } catch (const std::exception& e) {
        tracer_.emit("task_status_failed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task.id));
            w.field("error", std::string_view{e.what()});
        });
        return;
    }

    tracer_.emit("task_offered", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task.id));
    });
}

} // namespace gigdispatch::algo

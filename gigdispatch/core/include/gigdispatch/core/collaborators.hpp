#pragma once

/// @file collaborators.hpp
/// @brief Contracts of the external services the dispatch engine consumes.
///
/// None of these prescribe a storage engine, transport or format. Every
/// method receives the caller's CallContext so implementations can honour
/// the host's timeout and cancellation budget. Failures are reported by
/// throwing; NotFoundError is the only type the engine interprets, all
/// other exceptions are treated as collaborator failures.
///
/// @ingroup core_collaborators

#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/offer.hpp>
#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/types.hpp>
#include <gigdispatch/core/worker.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace gigdispatch::core {

/// @brief Read access to worker profiles.
/// @ingroup core_collaborators
class WorkerRepository {
public:
    virtual ~WorkerRepository() = default;

    /// @brief Load one worker profile.
    /// @throws NotFoundError if @p worker_id is unknown.
    virtual GigWorker get_by_id(const CallContext& ctx, WorkerId worker_id) = 0;

    /// @brief Online workers of one of @p types within @p radius_km of @p center.
    virtual std::vector<GigWorker> find_online_within_radius(const CallContext& ctx,
                                                             GeoPoint center,
                                                             double radius_km,
                                                             std::span<const WorkerType> types) = 0;
};

/// @brief Task persistence.
///
/// assign_worker() is the single serialization point that makes offer
/// acceptance exclusive: it must behave as an atomic compare-and-set even
/// when several engine instances share the storage.
/// @ingroup core_collaborators
class TaskRepository {
public:
    virtual ~TaskRepository() = default;

    /// @throws NotFoundError if @p task_id is unknown.
    virtual Task get_by_id(const CallContext& ctx, TaskId task_id) = 0;

    /// @brief Move the task from @p from to @p to if it is currently @p from.
    /// @return true if the status was changed.
    /// @throws NotFoundError if @p task_id is unknown.
    virtual bool update_status(const CallContext& ctx, TaskId task_id, TaskStatus from,
                               TaskStatus to) = 0;

    /// @brief Assign @p worker_id and move the task to Accepted, but only if
    ///        the task is still Pending or Offered and has no assigned worker.
    /// @return true if this call won the assignment.
    /// @throws NotFoundError if @p task_id is unknown.
    virtual bool assign_worker(const CallContext& ctx, TaskId task_id, WorkerId worker_id) = 0;

    /// @brief Undo assign_worker(): clear the assignment and move the task
    ///        back to Offered, but only if it is Accepted by @p worker_id.
    /// @return true if the assignment was released.
    virtual bool release_assignment(const CallContext& ctx, TaskId task_id, WorkerId worker_id) = 0;
};

/// @brief Offer persistence.
///
/// transition() is a compare-and-set on the status, so a terminal offer can
/// never be moved again regardless of which engine instance tries.
/// @ingroup core_collaborators
class OfferRepository {
public:
    virtual ~OfferRepository() = default;

    /// @brief Persist a new offer and assign its id.
    /// @return The id given to the stored offer.
    /// @throws InvalidStateError if the worker already holds a pending offer
    ///         for the same task.
    virtual OfferId create(const CallContext& ctx, const TaskOffer& offer) = 0;

    /// @throws NotFoundError if @p offer_id is unknown.
    virtual TaskOffer get_by_id(const CallContext& ctx, OfferId offer_id) = 0;

    /// @brief Every offer ever made for @p task_id, whatever its status.
    virtual std::vector<TaskOffer> list_for_task(const CallContext& ctx, TaskId task_id) = 0;

    /// @brief Pending offers for @p task_id that have not expired at @p now.
    virtual std::vector<TaskOffer> list_active_for_task(const CallContext& ctx, TaskId task_id,
                                                        TimePoint now) = 0;

    /// @brief Pending offers held by @p worker_id that have not expired at @p now.
    virtual std::vector<TaskOffer> list_active_for_worker(const CallContext& ctx, WorkerId worker_id,
                                                          TimePoint now) = 0;

    /// @brief Move an offer from @p from to @p to if it is currently @p from.
    /// @param at      Response time recorded on the offer.
    /// @param reason  Decline reason (recorded only for Declined).
    /// @return true if the status was changed.
    /// @throws NotFoundError if @p offer_id is unknown.
    virtual bool transition(const CallContext& ctx, OfferId offer_id, OfferStatus from,
                            OfferStatus to, TimePoint at, std::string_view reason = {}) = 0;

    /// @brief Mark every pending offer whose expiry is before @p now as Expired.
    /// @return The offers that were expired by this call.
    virtual std::vector<TaskOffer> expire_stale(const CallContext& ctx, TimePoint now) = 0;
};

/// @brief A driving route between two points.
/// @ingroup core_collaborators
struct Route {
    std::vector<GeoPoint> path;
    double distance_km{0.0};
};

/// @brief Geographic computations.
/// @ingroup core_collaborators
class GeoService {
public:
    virtual ~GeoService() = default;

    /// @brief Distance in kilometres between @p from and @p to.
    virtual double distance_km(GeoPoint from, GeoPoint to) = 0;

    /// @brief Travel time in whole minutes for @p vehicle_type.
    virtual int eta_minutes(const CallContext& ctx, GeoPoint from, GeoPoint to,
                            std::string_view vehicle_type) = 0;

    /// @brief Road route from @p from to @p to.
    virtual Route driving_route(const CallContext& ctx, GeoPoint from, GeoPoint to) = 0;
};

/// @brief Earning breakdown produced by the pricing collaborator.
/// @ingroup core_collaborators
struct EarningBreakdown {
    Money base;
    Money distance;
    Money weight;
    Money time;
    double surge_multiplier{1.0};
    Money bonus;
    Money total;
};

/// @brief Pricing collaborator; a black box to the engine.
/// @ingroup core_collaborators
class EarningCalculator {
public:
    virtual ~EarningCalculator() = default;

    /// @brief Earning @p worker would receive for @p task at @p distance_km.
    virtual EarningBreakdown compute(const CallContext& ctx, const Task& task,
                                     const GigWorker& worker, double distance_km) = 0;
};

/// @brief Push channel to worker devices.
/// @ingroup core_collaborators
class WorkerNotifier {
public:
    virtual ~WorkerNotifier() = default;

    /// @brief Deliver a new offer to its worker.
    virtual void push_offer(const CallContext& ctx, WorkerId worker_id, const TaskOffer& offer,
                            const Task& task) = 0;

    /// @brief Tell a worker something changed about @p task.
    virtual void push_task_update(const CallContext& ctx, WorkerId worker_id, const Task& task,
                                  std::string_view message) = 0;
};

} // namespace gigdispatch::core

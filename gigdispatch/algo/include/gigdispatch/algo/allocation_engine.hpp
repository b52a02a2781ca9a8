#pragma once

#include <gigdispatch/algo/candidate_discovery.hpp>
#include <gigdispatch/algo/config.hpp>
#include <gigdispatch/algo/offer_dispatcher.hpp>
#include <gigdispatch/algo/strategy.hpp>

#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/trace_writer.hpp>
#include <gigdispatch/core/tracer.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gigdispatch::algo {

/// @brief Counters kept by the engine since construction.
/// @ingroup algo
struct EngineStats {
    uint64_t allocations{0};          ///< AllocateTask calls that ran to a result.
    uint64_t successful_allocations{0};
    double mean_match_seconds{0.0};   ///< Mean duration of successful allocations.
};

/// @brief External services the engine is wired to.
/// @ingroup algo
struct EngineCollaborators {
    core::WorkerRepository& workers;
    core::TaskRepository& tasks;
    core::OfferRepository& offers;
    core::GeoService& geo;
    core::EarningCalculator& earnings;
    core::WorkerNotifier& notifier;
};

/// @brief Task allocation and offer lifecycle.
///
/// The engine is the strategy executor and the offer lifecycle manager in
/// one object. It owns no persistent state: tasks and offers live in the
/// repositories, live worker state in the injected registry. All public
/// operations may be called concurrently from several threads.
///
/// Exclusivity of acceptance rests on the repositories' compare-and-set
/// operations. accept_offer() first claims the task with
/// core::TaskRepository::assign_worker() and only then moves the offer to
/// Accepted, releasing the claim if the offer moved in the meantime. Two
/// engines sharing the same storage therefore never accept two offers for
/// one task.
///
/// Allocations of one task are serialized inside an engine: reading the
/// task's offers and extending them happen under a per-task claim, so
/// concurrent callers never exceed the per-strategy offer limit.
///
/// Re-allocations triggered by declines and expiry run on threads owned by
/// the engine, at most one per task. A trigger arriving while one is running
/// is folded into it: the running job checks again, under the task's claim,
/// whether the task is still left without an active offer. wait_for_background()
/// joins them; the destructor requests them to stop and joins them too.
///
/// @code
/// AllocationEngine engine(config, clock, registry, {workers, tasks, offers, geo, pricing, notifier});
/// auto result = engine.allocate_task({}, task_id, Strategy::Broadcast);
/// auto task = engine.accept_offer({}, result.offer_ids.front(), result.worker_ids.front());
/// @endcode
///
/// @see WorkerStateRegistry, CandidateDiscovery, OfferDispatcher
/// @ingroup algo
class AllocationEngine {
public:
    /// @param config        Validated with validate_config().
    /// @param clock         Time source (must outlive the engine).
    /// @param registry      Live worker state (must outlive the engine).
    /// @param collaborators External services (must outlive the engine).
    /// @param writer        Trace destination, or nullptr.
    /// @throws ConfigError if @p config is invalid.
    AllocationEngine(AllocationConfig config, const core::Clock& clock,
                     core::WorkerStateRegistry& registry, EngineCollaborators collaborators,
                     core::TraceWriter* writer = nullptr);
    ~AllocationEngine();

    AllocationEngine(const AllocationEngine&) = delete;
    AllocationEngine& operator=(const AllocationEngine&) = delete;
    AllocationEngine(AllocationEngine&&) = delete;
    AllocationEngine& operator=(AllocationEngine&&) = delete;

    [[nodiscard]] const AllocationConfig& config() const noexcept { return config_; }

    /// @brief Replace the trace destination. Pass nullptr to disable tracing.
    void set_trace_writer(core::TraceWriter* writer) noexcept { tracer_.set_writer(writer); }

    // =========================================================================
    // Allocation
    // =========================================================================

    /// @brief Find, rank and offer @p task_id to workers using @p strategy.
    ///
    /// Workers that already hold an offer for the task are not considered
    /// again. Blocks while another allocation of the same task is running. With zero eligible workers the result has success == false and
    /// failure == NoEligibleWorkers, and neither offers nor the task change.
    ///
    /// @throws core::NotFoundError if the task is unknown.
    /// @throws core::InvalidStateError if the task is not pending/offered, or
    ///         if an extra offer would break the per-strategy offer limit.
    /// @throws core::CollaboratorError if a repository fails before any
    ///         offer is persisted.
    /// @throws core::CancelledError if @p ctx is cancelled.
    AllocationResult allocate_task(const core::CallContext& ctx, core::TaskId task_id,
                                   Strategy strategy);

    // =========================================================================
    // Offer lifecycle
    // =========================================================================

    /// @brief Accept an offer on behalf of @p worker_id.
    ///
    /// On success the task is assigned and Accepted, every other pending
    /// offer for it is cancelled (their workers are told), and the worker's
    /// active task count grows by one.
    ///
    /// @return The task as updated by the acceptance.
    /// @throws core::NotFoundError if the offer or task is unknown.
    /// @throws core::UnauthorizedError if the offer belongs to another worker.
    /// @throws core::InvalidStateError if the offer is not pending, the task
    ///         is not offerable, or another offer won the task.
    /// @throws core::ExpiredError if the offer's expiry has passed, whatever
    ///         its stored status.
    core::Task accept_offer(const core::CallContext& ctx, core::OfferId offer_id,
                            core::WorkerId worker_id);

    /// @brief Decline an offer on behalf of @p worker_id.
    ///
    /// When no active offer remains for the task and it is still offerable,
    /// a Broadcast re-allocation is scheduled in the background. Its outcome
    /// is traced only.
    ///
    /// @throws core::NotFoundError if the offer is unknown.
    /// @throws core::UnauthorizedError if the offer belongs to another worker.
    /// @throws core::InvalidStateError if the offer is not pending.
    void decline_offer(const core::CallContext& ctx, core::OfferId offer_id,
                       core::WorkerId worker_id, std::string_view reason);

    /// @brief Expire every stale pending offer and re-allocate the tasks left
    ///        without an active offer.
    /// @return Number of offers expired.
    std::size_t expire_stale_offers(const core::CallContext& ctx);

    // =========================================================================
    // Worker state
    // =========================================================================

    /// @brief Heartbeat ingestion; invalid coordinates are traced and ignored.
    void update_worker_location(core::WorkerId worker_id, core::GeoPoint location);

    void set_worker_availability(core::WorkerId worker_id, core::WorkerAvailability availability);

    /// @brief Release a task that reached a terminal state outside the engine.
    /// @return false if the worker had no active task to release.
    bool release_worker(core::TaskId task_id, core::WorkerId worker_id);

    /// @brief Flip workers with a stale heartbeat offline.
    /// @return The affected workers in ascending id order.
    std::vector<core::WorkerId> sweep_stale_workers();

    // =========================================================================
    // Supervision
    // =========================================================================

    /// @brief Block until every background re-allocation has finished.
    void wait_for_background();

    [[nodiscard]] EngineStats stats() const noexcept;

private:
    struct BackgroundJob {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Exclusive right to read and extend the offers of one task
    class TaskClaim {
    public:
        TaskClaim(AllocationEngine& engine, core::TaskId task_id);
        ~TaskClaim();

        TaskClaim(const TaskClaim&) = delete;
        TaskClaim& operator=(const TaskClaim&) = delete;
        TaskClaim(TaskClaim&&) = delete;
        TaskClaim& operator=(TaskClaim&&) = delete;

    private:
        AllocationEngine& engine_;
        core::TaskId task_id_;
    };

    AllocationResult allocate_claimed(const core::CallContext& ctx, core::TaskId task_id,
                                      Strategy strategy);
    [[nodiscard]] bool is_exhausted(const core::CallContext& ctx, core::TaskId task_id);
    void run_reallocation(const core::CallContext& ctx, core::TaskId task_id);

    void cancel_sibling_offers(const core::CallContext& ctx, const core::Task& task,
                               core::OfferId accepted_offer, core::TimePoint now);
    void reallocate_if_exhausted(const core::CallContext& ctx, core::TaskId task_id,
                                 std::string_view cause);
    void schedule_reallocation(core::TaskId task_id, std::string_view cause);
    void record_allocation(const AllocationResult& result, core::Duration elapsed);

    AllocationConfig config_;
    const core::Clock& clock_;
    core::WorkerStateRegistry& registry_;
    EngineCollaborators collaborators_;
    core::Tracer tracer_;
    CandidateDiscovery discovery_;
    OfferDispatcher dispatcher_;

    std::atomic<uint64_t> allocations_{0};
    std::atomic<uint64_t> successful_{0};
    std::atomic<int64_t> match_time_ns_{0};

    std::mutex claims_mutex_;
    std::condition_variable claims_released_;
    std::unordered_set<core::TaskId> claimed_;

    std::mutex background_mutex_;
    std::vector<BackgroundJob> background_;
    // Tasks with a re-allocation job; true when another trigger arrived meanwhile
    std::unordered_map<core::TaskId, bool> reallocating_;
};

} // namespace gigdispatch::algo

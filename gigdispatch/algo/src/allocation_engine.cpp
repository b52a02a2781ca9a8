#include <gigdispatch/algo/allocation_engine.hpp>

#include <gigdispatch/algo/scoring.hpp>

#include <gigdispatch/core/error.hpp>

#include <algorithm>
#include <exception>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

namespace gigdispatch::algo {

namespace {

constexpr std::string_view TASK_UNAVAILABLE_MESSAGE = "task no longer available";

// Run a collaborator call, wrapping anything that is not already part of the
// dispatch taxonomy.
template<typename F>
auto guarded(const char* collaborator, F&& call) -> decltype(call()) {
    try {
        return std::forward<F>(call)();
    } catch (const core::DispatchError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::CollaboratorError(collaborator, e.what());
    }
}

} // namespace

AllocationEngine::AllocationEngine(AllocationConfig config, const core::Clock& clock,
                                   core::WorkerStateRegistry& registry,
                                   EngineCollaborators collaborators, core::TraceWriter* writer)
    : config_(config)
    , clock_(clock)
    , registry_(registry)
    , collaborators_(collaborators)
    , tracer_(clock, writer)
    , discovery_(config_, clock, tracer_, registry, collaborators.workers, collaborators.geo,
                 collaborators.earnings)
    , dispatcher_(config_, clock, tracer_, collaborators.offers, collaborators.tasks,
                  collaborators.notifier) {
    validate_config(config_);
}

AllocationEngine::~AllocationEngine() {
    std::vector<BackgroundJob> jobs;
    {
        std::lock_guard lock(background_mutex_);
        jobs = std::move(background_);
    }
    for (auto& job : jobs) {
        job.thread.request_stop();
    }
    // jthread destructors join
}

// ============================================================================
// Allocation
// ============================================================================

AllocationEngine::TaskClaim::TaskClaim(AllocationEngine& engine, core::TaskId task_id)
    : engine_(engine)
    , task_id_(task_id) {
    std::unique_lock lock(engine_.claims_mutex_);
    engine_.claims_released_.wait(lock, [this] { return !engine_.claimed_.contains(task_id_); });
    engine_.claimed_.insert(task_id_);
}

AllocationEngine::TaskClaim::~TaskClaim() {
    {
        std::lock_guard lock(engine_.claims_mutex_);
        engine_.claimed_.erase(task_id_);
    }
    engine_.claims_released_.notify_all();
}

AllocationResult AllocationEngine::allocate_task(const core::CallContext& ctx, core::TaskId task_id,
                                                 Strategy strategy) {
    ctx.check(clock_, "allocate_task");

    TaskClaim claim(*this, task_id);
    return allocate_claimed(ctx, task_id, strategy);
}

AllocationResult AllocationEngine::allocate_claimed(const core::CallContext& ctx,
                                                    core::TaskId task_id, Strategy strategy) {
    const core::TimePoint started = clock_.now();
    const StrategyEntry& entry = strategy_entry(strategy);

    tracer_.emit("allocation_started", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task_id));
        w.field("strategy", entry.name);
    });

    core::Task task = guarded("task repository", [&] {
        return collaborators_.tasks.get_by_id(ctx, task_id);
    });
    if (!task.is_offerable()) {
        throw core::InvalidStateError("task " + std::to_string(task_id) + " is " +
                                      std::string(core::to_string(task.status)) +
                                      " and cannot be offered");
    }

    // Workers that already saw this task are not asked again
    auto existing = guarded("offer repository", [&] {
        return collaborators_.offers.list_for_task(ctx, task_id);
    });
    std::unordered_set<core::WorkerId> exclude;
    std::size_t active = 0;
    for (const auto& offer : existing) {
        exclude.insert(offer.worker_id);
        if (offer.is_active_at(started)) {
            ++active;
        }
    }

    std::size_t fan_out = 1;
    if (strategy == Strategy::Broadcast) {
        if (active >= config_.max_concurrent_offers) {
            throw core::InvalidStateError("task " + std::to_string(task_id) +
                                          " already has the maximum number of pending offers");
        }
        fan_out = config_.max_concurrent_offers - active;
    } else if (active > 0) {
        throw core::InvalidStateError("task " + std::to_string(task_id) +
                                      " already has a pending offer");
    }

    std::vector<Candidate> candidates = discovery_.discover(ctx, task, exclude);

    if (candidates.empty()) {
        AllocationResult result;
        result.task_id = task_id;
        result.strategy = strategy;
        result.failure = AllocationFailure::NoEligibleWorkers;
        result.message = "no eligible workers available";
        record_allocation(result, clock_.now() - started);
        return result;
    }

    ctx.check(clock_, "ranking");
    rank_candidates(candidates, entry.weights(config_), config_);

    tracer_.emit("candidates_ranked", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task_id));
        w.field("count", static_cast<uint64_t>(candidates.size()));
        w.field("top_worker_id", static_cast<uint64_t>(candidates.front().worker.id));
        w.field("top_score", candidates.front().score);
    });

    StrategyContext strategy_ctx{
        .call = ctx,
        .config = config_,
        .dispatcher = dispatcher_,
        .fan_out = fan_out,
    };
    AllocationResult result = entry.execute(strategy_ctx, task, candidates);
    result.strategy = strategy;

    record_allocation(result, clock_.now() - started);
    return result;
}

void AllocationEngine::record_allocation(const AllocationResult& result, core::Duration elapsed) {
    allocations_.fetch_add(1, std::memory_order_relaxed);

    if (result.success) {
        successful_.fetch_add(1, std::memory_order_relaxed);
        match_time_ns_.fetch_add(elapsed.nanoseconds(), std::memory_order_relaxed);

        tracer_.emit("allocation_completed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(result.task_id));
            w.field("strategy", to_string(result.strategy));
            w.field("offers_attempted", static_cast<uint64_t>(result.offers_attempted));
            w.field("offers_created", static_cast<uint64_t>(result.offers_created));
            w.field("duration", elapsed.seconds());
        });
        return;
    }

    tracer_.emit("allocation_failed", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(result.task_id));
        w.field("strategy", to_string(result.strategy));
        w.field("reason", result.failure ? to_string(*result.failure) : std::string_view{"unknown"});
        w.field("offers_attempted", static_cast<uint64_t>(result.offers_attempted));
    });
}

// ============================================================================
// Offer lifecycle
// ============================================================================

core::Task AllocationEngine::accept_offer(const core::CallContext& ctx, core::OfferId offer_id,
                                          core::WorkerId worker_id) {
    ctx.check(clock_, "accept_offer");

    const core::TimePoint now = clock_.now();

    core::TaskOffer offer = guarded("offer repository", [&] {
        return collaborators_.offers.get_by_id(ctx, offer_id);
    });
    if (offer.worker_id != worker_id) {
        throw core::UnauthorizedError("offer " + std::to_string(offer_id) +
                                      " does not belong to worker " + std::to_string(worker_id));
    }
    if (offer.status != core::OfferStatus::Pending) {
        throw core::InvalidStateError("offer " + std::to_string(offer_id) + " is " +
                                      std::string(core::to_string(offer.status)));
    }

    if (offer.is_expired_at(now)) {
        // Record the expiry now rather than waiting for the sweep
        bool moved = false;
        try {
            moved = collaborators_.offers.transition(ctx, offer_id, core::OfferStatus::Pending,
                                                     core::OfferStatus::Expired, now);
        } catch (const std::exception& e) {
            tracer_.emit("offer_expire_failed", [&](core::TraceWriter& w) {
                w.field("offer_id", static_cast<uint64_t>(offer_id));
                w.field("error", std::string_view{e.what()});
            });
        }
        if (moved) {
            tracer_.emit("offer_expired", [&](core::TraceWriter& w) {
                w.field("offer_id", static_cast<uint64_t>(offer_id));
                w.field("task_id", static_cast<uint64_t>(offer.task_id));
                w.field("worker_id", static_cast<uint64_t>(worker_id));
            });
        }
        throw core::ExpiredError("offer " + std::to_string(offer_id) + " expired");
    }

    core::Task task = guarded("task repository", [&] {
        return collaborators_.tasks.get_by_id(ctx, offer.task_id);
    });
    if (!task.is_offerable()) {
        throw core::InvalidStateError("task " + std::to_string(task.id) + " is no longer available");
    }

    // Serialization point: exactly one caller wins the task
    bool won = guarded("task repository", [&] {
        return collaborators_.tasks.assign_worker(ctx, task.id, worker_id);
    });
    if (!won) {
        throw core::InvalidStateError("task " + std::to_string(task.id) + " was already accepted");
    }

    bool committed = false;
    std::optional<std::string> commit_error;
    try {
        committed = collaborators_.offers.transition(ctx, offer_id, core::OfferStatus::Pending,
                                                     core::OfferStatus::Accepted, now);
    } catch (const std::exception& e) {
        commit_error = e.what();
    }

    if (!committed) {
        bool released = false;
        try {
            released = collaborators_.tasks.release_assignment(ctx, task.id, worker_id);
        } catch (const std::exception& e) {
            tracer_.emit("assignment_rollback_failed", [&](core::TraceWriter& w) {
                w.field("task_id", static_cast<uint64_t>(task.id));
                w.field("worker_id", static_cast<uint64_t>(worker_id));
                w.field("error", std::string_view{e.what()});
            });
        }
        if (released) {
            tracer_.emit("assignment_rolled_back", [&](core::TraceWriter& w) {
                w.field("task_id", static_cast<uint64_t>(task.id));
                w.field("worker_id", static_cast<uint64_t>(worker_id));
            });
            // A sweep that ran while the task was claimed skipped it
            reallocate_if_exhausted(ctx, task.id, "rolled_back");
        }
        if (commit_error) {
            throw core::CollaboratorError("offer repository", *commit_error);
        }
        throw core::InvalidStateError("offer " + std::to_string(offer_id) +
                                      " is no longer pending");
    }

    task.status = core::TaskStatus::Accepted;
    task.assigned_worker = worker_id;

    registry_.assign_task(worker_id, task.id, now);

    tracer_.emit("offer_accepted", [&](core::TraceWriter& w) {
        w.field("offer_id", static_cast<uint64_t>(offer_id));
        w.field("task_id", static_cast<uint64_t>(task.id));
        w.field("worker_id", static_cast<uint64_t>(worker_id));
        w.field("response_time", (now - offer.offered_at).seconds());
    });

    cancel_sibling_offers(ctx, task, offer_id, now);

    return task;
}

void AllocationEngine::cancel_sibling_offers(const core::CallContext& ctx, const core::Task& task,
                                             core::OfferId accepted_offer, core::TimePoint now) {
    std::vector<core::TaskOffer> siblings;
    try {
        siblings = collaborators_.offers.list_for_task(ctx, task.id);
    } catch (const std::exception& e) {
        tracer_.emit("offer_cancel_failed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task.id));
            w.field("error", std::string_view{e.what()});
        });
        return;
    }

    for (const auto& sibling : siblings) {
        if (sibling.id == accepted_offer || sibling.status != core::OfferStatus::Pending) {
            continue;
        }

        bool cancelled = false;
        try {
            cancelled = collaborators_.offers.transition(ctx, sibling.id, core::OfferStatus::Pending,
                                                         core::OfferStatus::Cancelled, now);
        } catch (const std::exception& e) {
            tracer_.emit("offer_cancel_failed", [&](core::TraceWriter& w) {
                w.field("task_id", static_cast<uint64_t>(task.id));
                w.field("offer_id", static_cast<uint64_t>(sibling.id));
                w.field("error", std::string_view{e.what()});
            });
            continue;
        }
        if (!cancelled) {
            continue;
        }

        tracer_.emit("offer_cancelled", [&](core::TraceWriter& w) {
            w.field("offer_id", static_cast<uint64_t>(sibling.id));
            w.field("task_id", static_cast<uint64_t>(task.id));
            w.field("worker_id", static_cast<uint64_t>(sibling.worker_id));
        });

        try {
            collaborators_.notifier.push_task_update(ctx, sibling.worker_id, task,
                                                     TASK_UNAVAILABLE_MESSAGE);
        } catch (const std::exception& e) {
            tracer_.emit("offer_notify_failed", [&](core::TraceWriter& w) {
                w.field("offer_id", static_cast<uint64_t>(sibling.id));
                w.field("worker_id", static_cast<uint64_t>(sibling.worker_id));
                w.field("error", std::string_view{e.what()});
            });
        }
    }
}

void AllocationEngine::decline_offer(const core::CallContext& ctx, core::OfferId offer_id,
                                     core::WorkerId worker_id, std::string_view reason) {
    ctx.check(clock_, "decline_offer");

    const core::TimePoint now = clock_.now();

    core::TaskOffer offer = guarded("offer repository", [&] {
        return collaborators_.offers.get_by_id(ctx, offer_id);
    });
    if (offer.worker_id != worker_id) {
        throw core::UnauthorizedError("offer " + std::to_string(offer_id) +
                                      " does not belong to worker " + std::to_string(worker_id));
    }
    if (offer.status != core::OfferStatus::Pending) {
        throw core::InvalidStateError("offer " + std::to_string(offer_id) + " is " +
                                      std::string(core::to_string(offer.status)));
    }

    bool moved = guarded("offer repository", [&] {
        return collaborators_.offers.transition(ctx, offer_id, core::OfferStatus::Pending,
                                                core::OfferStatus::Declined, now, reason);
    });
    if (!moved) {
        throw core::InvalidStateError("offer " + std::to_string(offer_id) +
                                      " is no longer pending");
    }

    tracer_.emit("offer_declined", [&](core::TraceWriter& w) {
        w.field("offer_id", static_cast<uint64_t>(offer_id));
        w.field("task_id", static_cast<uint64_t>(offer.task_id));
        w.field("worker_id", static_cast<uint64_t>(worker_id));
        w.field("reason", reason);
    });

    reallocate_if_exhausted(ctx, offer.task_id, "declined");
}

std::size_t AllocationEngine::expire_stale_offers(const core::CallContext& ctx) {
    ctx.check(clock_, "expire_stale_offers");

    auto expired = guarded("offer repository", [&] {
        return collaborators_.offers.expire_stale(ctx, clock_.now());
    });

    std::set<core::TaskId> affected;
    for (const auto& offer : expired) {
        tracer_.emit("offer_expired", [&](core::TraceWriter& w) {
            w.field("offer_id", static_cast<uint64_t>(offer.id));
            w.field("task_id", static_cast<uint64_t>(offer.task_id));
            w.field("worker_id", static_cast<uint64_t>(offer.worker_id));
        });
        affected.insert(offer.task_id);
    }

    for (core::TaskId task_id : affected) {
        reallocate_if_exhausted(ctx, task_id, "expired");
    }
    return expired.size();
}

bool AllocationEngine::is_exhausted(const core::CallContext& ctx, core::TaskId task_id) {
    auto remaining = collaborators_.offers.list_active_for_task(ctx, task_id, clock_.now());
    if (!remaining.empty()) {
        return false;
    }
    return collaborators_.tasks.get_by_id(ctx, task_id).is_offerable();
}

void AllocationEngine::reallocate_if_exhausted(const core::CallContext& ctx, core::TaskId task_id,
                                               std::string_view cause) {
    // The triggering response already succeeded; problems here are traced only
    try {
        if (!is_exhausted(ctx, task_id)) {
            return;
        }
    } catch (const std::exception& e) {
        tracer_.emit("reallocation_failed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task_id));
            w.field("cause", cause);
            w.field("error", std::string_view{e.what()});
        });
        return;
    }

    schedule_reallocation(task_id, cause);
}

void AllocationEngine::schedule_reallocation(core::TaskId task_id, std::string_view cause) {
    std::lock_guard lock(background_mutex_);

    if (auto it = reallocating_.find(task_id); it != reallocating_.end()) {
        it->second = true;
        tracer_.emit("reallocation_coalesced", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task_id));
            w.field("cause", cause);
        });
        return;
    }
    reallocating_.emplace(task_id, false);

    tracer_.emit("reallocation_scheduled", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task_id));
        w.field("cause", cause);
    });

    // Reap finished jobs before adding a new one
    std::erase_if(background_, [](const BackgroundJob& job) {
        return job.done->load(std::memory_order_acquire);
    });

    auto done = std::make_shared<std::atomic<bool>>(false);
    background_.push_back(BackgroundJob{
        .thread = std::jthread([this, task_id, done](std::stop_token stop) {
            core::CallContext ctx{.stop = std::move(stop), .deadline = std::nullopt};
            for (;;) {
                try {
                    run_reallocation(ctx, task_id);
                } catch (const std::exception& e) {
                    tracer_.emit("reallocation_failed", [&](core::TraceWriter& w) {
                        w.field("task_id", static_cast<uint64_t>(task_id));
                        w.field("error", std::string_view{e.what()});
                    });
                }

                std::lock_guard job_lock(background_mutex_);
                auto it = reallocating_.find(task_id);
                if (!it->second || ctx.stop.stop_requested()) {
                    reallocating_.erase(it);
                    break;
                }
                it->second = false;
            }
            done->store(true, std::memory_order_release);
        }),
        .done = done,
    });
}

void AllocationEngine::run_reallocation(const core::CallContext& ctx, core::TaskId task_id) {
    ctx.check(clock_, "reallocation");
    TaskClaim claim(*this, task_id);

    // Another allocation may have offered the task since the trigger
    if (!is_exhausted(ctx, task_id)) {
        tracer_.emit("reallocation_skipped", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task_id));
        });
        return;
    }

    auto result = allocate_claimed(ctx, task_id, Strategy::Broadcast);
    if (!result.success) {
        tracer_.emit("reallocation_failed", [&](core::TraceWriter& w) {
            w.field("task_id", static_cast<uint64_t>(task_id));
            w.field("error", std::string_view{result.message});
        });
    }
}

void AllocationEngine::wait_for_background() {
    for (;;) {
        std::vector<BackgroundJob> jobs;
        {
            std::lock_guard lock(background_mutex_);
            jobs = std::move(background_);
            background_.clear();
        }
        if (jobs.empty()) {
            return;
        }
        for (auto& job : jobs) {
            if (job.thread.joinable()) {
                job.thread.join();
            }
        }
    }
}

// ============================================================================
// Worker state
// ============================================================================

void AllocationEngine::update_worker_location(core::WorkerId worker_id, core::GeoPoint location) {
    if (!location.valid()) {
        tracer_.emit("location_rejected", [&](core::TraceWriter& w) {
            w.field("worker_id", static_cast<uint64_t>(worker_id));
            w.field("latitude", location.latitude);
            w.field("longitude", location.longitude);
        });
        return;
    }
    registry_.update_location(worker_id, location, clock_.now());
}

void AllocationEngine::set_worker_availability(core::WorkerId worker_id,
                                               core::WorkerAvailability availability) {
    registry_.set_availability(worker_id, availability, clock_.now());
}

bool AllocationEngine::release_worker(core::TaskId task_id, core::WorkerId worker_id) {
    if (!registry_.release_task(worker_id, task_id)) {
        return false;
    }
    tracer_.emit("worker_released", [&](core::TraceWriter& w) {
        w.field("worker_id", static_cast<uint64_t>(worker_id));
        w.field("task_id", static_cast<uint64_t>(task_id));
    });
    return true;
}

std::vector<core::WorkerId> AllocationEngine::sweep_stale_workers() {
    const core::TimePoint cutoff =
        clock_.now() - core::duration_from_seconds(config_.heartbeat_timeout_seconds);

    auto stale = registry_.mark_stale_offline(cutoff);
    for (core::WorkerId worker_id : stale) {
        tracer_.emit("worker_stale", [&](core::TraceWriter& w) {
            w.field("worker_id", static_cast<uint64_t>(worker_id));
        });
    }
    return stale;
}

EngineStats AllocationEngine::stats() const noexcept {
    EngineStats stats;
    stats.allocations = allocations_.load(std::memory_order_relaxed);
    stats.successful_allocations = successful_.load(std::memory_order_relaxed);
    if (stats.successful_allocations > 0) {
        stats.mean_match_seconds =
            core::duration_from_nanoseconds(match_time_ns_.load(std::memory_order_relaxed)).seconds() /
            static_cast<double>(stats.successful_allocations);
    }
    return stats;
}

} // namespace gigdispatch::algo

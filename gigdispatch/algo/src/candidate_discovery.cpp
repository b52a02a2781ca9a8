#include <gigdispatch/algo/candidate_discovery.hpp>

#include <gigdispatch/core/error.hpp>

#include <exception>

namespace gigdispatch::algo {

std::vector<core::WorkerType> required_worker_types(const core::Task& task) {
    using core::WorkerType;

    switch (task.type) {
    case core::TaskType::Delivery:
        if (task.total_weight_kg > HEAVY_DELIVERY_KG) {
            return {WorkerType::Driver};
        }
        if (task.total_weight_kg > MEDIUM_DELIVERY_KG) {
            return {WorkerType::Driver, WorkerType::Rider};
        }
        return {WorkerType::Driver, WorkerType::Rider, WorkerType::Cyclist};
    case core::TaskType::Collection:
        return {WorkerType::Collector, WorkerType::Driver, WorkerType::Rider};
    case core::TaskType::Survey:
        return {WorkerType::Surveyor, WorkerType::Walker};
    case core::TaskType::Merchandising:
        return {WorkerType::Merchandiser, WorkerType::Walker};
    }
    return {WorkerType::Driver, WorkerType::Rider};
}

std::optional<std::string_view> check_eligibility(const core::GigWorker& worker,
                                                  const core::Task& task,
                                                  const AllocationConfig& config) {
    if (worker.status != core::WorkerStatus::Active) {
        return "inactive";
    }
    if (worker.verification_status != core::VerificationStatus::Approved) {
        return "unverified";
    }
    if (worker.rating < config.min_worker_rating) {
        return "rating_below_minimum";
    }
    if (!worker.accepts_task_type(task.type)) {
        return "task_type_not_preferred";
    }
    if (task.total_weight_kg > 0.0 && worker.vehicle &&
        worker.vehicle->capacity_kg < task.total_weight_kg) {
        return "insufficient_capacity";
    }
    if (task.collection_amount.is_positive() && !worker.preferences.accept_cod) {
        return "cod_not_accepted";
    }
    return std::nullopt;
}

CandidateDiscovery::CandidateDiscovery(const AllocationConfig& config, const core::Clock& clock,
                                       core::Tracer& tracer, core::WorkerStateRegistry& registry,
                                       core::WorkerRepository& workers, core::GeoService& geo,
                                       core::EarningCalculator& earnings)
    : config_(config)
    , clock_(clock)
    , tracer_(tracer)
    , registry_(registry)
    , workers_(workers)
    , geo_(geo)
    , earnings_(earnings) {}

std::vector<Candidate> CandidateDiscovery::discover(const core::CallContext& ctx,
                                                    const core::Task& task,
                                                    const std::unordered_set<core::WorkerId>& exclude) {
    const core::GeoPoint location = task.effective_location();
    const auto types = required_worker_types(task);

    std::vector<core::GigWorker> nearby;
    try {
        nearby = workers_.find_online_within_radius(ctx, location, config_.max_worker_distance_km, types);
    } catch (const core::CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::CollaboratorError("worker repository", e.what());
    }

    std::vector<Candidate> candidates;
    candidates.reserve(nearby.size());

    for (auto& worker : nearby) {
        ctx.check(clock_, "candidate discovery");

        if (exclude.contains(worker.id)) {
            continue;
        }
        if (auto reason = check_eligibility(worker, task, config_)) {
            reject(task, worker.id, *reason);
            continue;
        }

        auto state = registry_.find(worker.id);
        if (!state || state->availability != core::WorkerAvailability::Online) {
            reject(task, worker.id, "not_online");
            continue;
        }

        double distance = geo_.distance_km(state->location, location);
        if (distance > config_.max_worker_distance_km) {
            reject(task, worker.id, "too_far");
            continue;
        }

        int eta = 0;
        try {
            eta = geo_.eta_minutes(ctx, state->location, location, worker.vehicle_type());
        } catch (const core::CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            eta = static_cast<int>(distance * FALLBACK_MINUTES_PER_KM);
            tracer_.emit("eta_fallback", [&](core::TraceWriter& w) {
                w.field("task_id", static_cast<uint64_t>(task.id));
                w.field("worker_id", static_cast<uint64_t>(worker.id));
                w.field("minutes", static_cast<uint64_t>(eta));
                w.field("error", std::string_view{e.what()});
            });
        }

        core::EarningBreakdown earning;
        try {
            earning = earnings_.compute(ctx, task, worker, distance);
        } catch (const core::CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            tracer_.emit("earning_failed", [&](core::TraceWriter& w) {
                w.field("task_id", static_cast<uint64_t>(task.id));
                w.field("worker_id", static_cast<uint64_t>(worker.id));
                w.field("error", std::string_view{e.what()});
            });
            continue;
        }

        candidates.push_back(Candidate{
            .worker = std::move(worker),
            .state = *state,
            .distance_km = distance,
            .eta_minutes = eta,
            .earning = earning,
            .score = 0.0,
            .breakdown = {},
        });
    }

    return candidates;
}

void CandidateDiscovery::reject(const core::Task& task, core::WorkerId worker_id,
                                std::string_view reason) {
    tracer_.emit("candidate_rejected", [&](core::TraceWriter& w) {
        w.field("task_id", static_cast<uint64_t>(task.id));
        w.field("worker_id", static_cast<uint64_t>(worker_id));
        w.field("reason", reason);
    });
}

} // namespace gigdispatch::algo

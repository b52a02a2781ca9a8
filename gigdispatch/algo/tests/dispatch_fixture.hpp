#pragma once

#include <gigdispatch/algo/allocation_engine.hpp>
#include <gigdispatch/algo/config.hpp>

#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <gigdispatch/io/trace_writers.hpp>

#include <gigdispatch/store/earning_calculator.hpp>
#include <gigdispatch/store/geo_service.hpp>
#include <gigdispatch/store/notifier.hpp>
#include <gigdispatch/store/offer_repository.hpp>
#include <gigdispatch/store/task_repository.hpp>
#include <gigdispatch/store/worker_repository.hpp>

namespace gigdispatch::fixtures {

// Task location shared by most tests
inline constexpr core::GeoPoint ORIGIN{6.5, 3.4};

// Point @p km north of ORIGIN
inline core::GeoPoint north_of_origin(double km) {
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
    return core::GeoPoint{ORIGIN.latitude + km / (store::EARTH_RADIUS_KM * DEG_TO_RAD),
                          ORIGIN.longitude};
}

// Active, approved rider with a motorcycle
inline core::GigWorker make_worker(core::WorkerId id) {
    core::GigWorker worker;
    worker.id = id;
    worker.type = core::WorkerType::Rider;
    worker.status = core::WorkerStatus::Active;
    worker.verification_status = core::VerificationStatus::Approved;
    worker.rating = 4.5;
    worker.completed_tasks = 50;
    worker.acceptance_rate = 0.8;
    worker.on_time_rate = 0.9;
    worker.vehicle = core::Vehicle{"motorcycle", 20.0};
    return worker;
}

// 5 kg delivery picked up at ORIGIN
inline core::Task make_task(core::TaskId id) {
    core::Task task;
    task.id = id;
    task.type = core::TaskType::Delivery;
    task.pickup = core::Address{"warehouse", ORIGIN};
    task.dropoff = core::Address{"customer", north_of_origin(3.0)};
    task.total_weight_kg = 5.0;
    return task;
}

/// Engine collaborators backed by the in-memory stores, on a manual clock.
struct DispatchWorld {
    core::ManualClock clock{core::time_from_seconds(1000.0)};
    core::WorkerStateRegistry registry;
    store::HaversineGeoService geo;
    store::FlatRateEarningCalculator earnings;
    store::RecordingNotifier notifier;
    store::InMemoryTaskRepository tasks;
    store::InMemoryOfferRepository offers;
    store::InMemoryWorkerRepository workers{registry, geo};
    io::MemoryTraceWriter trace;
    core::CallContext ctx;

    algo::EngineCollaborators collaborators() {
        return algo::EngineCollaborators{
            .workers = workers,
            .tasks = tasks,
            .offers = offers,
            .geo = geo,
            .earnings = earnings,
            .notifier = notifier,
        };
    }

    // Register @p worker online at @p km from ORIGIN
    void add_worker(const core::GigWorker& worker, double km,
                    core::WorkerAvailability availability = core::WorkerAvailability::Online) {
        workers.upsert(worker);
        registry.update_location(worker.id, north_of_origin(km), clock.now());
        registry.set_availability(worker.id, availability, clock.now());
    }

    void add_task(const core::Task& task) { tasks.upsert(task); }
};

} // namespace gigdispatch::fixtures

#include <gigdispatch/store/worker_repository.hpp>

#include <gigdispatch/core/error.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

namespace gigdispatch::store {

InMemoryWorkerRepository::InMemoryWorkerRepository(const core::WorkerStateRegistry& registry,
                                                   core::GeoService& geo)
    : registry_(registry)
    , geo_(geo) {}

void InMemoryWorkerRepository::upsert(core::GigWorker worker) {
    std::unique_lock lock(mutex_);
    core::WorkerId id = worker.id;
    workers_.insert_or_assign(id, std::move(worker));
}

std::size_t InMemoryWorkerRepository::size() const {
    std::shared_lock lock(mutex_);
    return workers_.size();
}

core::GigWorker InMemoryWorkerRepository::get_by_id(const core::CallContext& /*ctx*/,
                                                    core::WorkerId worker_id) {
    std::shared_lock lock(mutex_);
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) {
        throw core::NotFoundError("worker " + std::to_string(worker_id) + " not found");
    }
    return it->second;
}

std::vector<core::GigWorker> InMemoryWorkerRepository::find_online_within_radius(
    const core::CallContext& /*ctx*/, core::GeoPoint center, double radius_km,
    std::span<const core::WorkerType> types) {
    std::vector<core::GigWorker> result;

    std::shared_lock lock(mutex_);
    for (const auto& [id, worker] : workers_) {
        if (std::find(types.begin(), types.end(), worker.type) == types.end()) {
            continue;
        }
        auto state = registry_.find(id);
        if (!state || state->availability != core::WorkerAvailability::Online) {
            continue;
        }
        if (geo_.distance_km(state->location, center) > radius_km) {
            continue;
        }
        result.push_back(worker);
    }
    return result;
}

} // namespace gigdispatch::store

#pragma once

#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/worker.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <vector>

namespace gigdispatch::store {

/// @brief Worker profiles held in memory.
///
/// Radius queries combine the stored profiles with the live registry: a
/// worker is returned when its registry entry is online and lies within the
/// radius according to the supplied GeoService. Results are in ascending id
/// order.
///
/// @ingroup store
class InMemoryWorkerRepository : public core::WorkerRepository {
public:
    InMemoryWorkerRepository(const core::WorkerStateRegistry& registry, core::GeoService& geo);

    /// @brief Insert or replace a profile.
    void upsert(core::GigWorker worker);

    [[nodiscard]] std::size_t size() const;

    core::GigWorker get_by_id(const core::CallContext& ctx, core::WorkerId worker_id) override;

    std::vector<core::GigWorker> find_online_within_radius(
        const core::CallContext& ctx, core::GeoPoint center, double radius_km,
        std::span<const core::WorkerType> types) override;

private:
    const core::WorkerStateRegistry& registry_;
    core::GeoService& geo_;
    mutable std::shared_mutex mutex_;
    std::map<core::WorkerId, core::GigWorker> workers_;
};

} // namespace gigdispatch::store

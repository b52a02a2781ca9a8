#pragma once

#include <gigdispatch/core/types.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gigdispatch::core {

/// @brief Live availability reported by the worker's device.
/// @ingroup core_registry
enum class WorkerAvailability {
    Online,
    Offline,
    Busy
};

[[nodiscard]] std::string_view to_string(WorkerAvailability availability) noexcept;
[[nodiscard]] std::optional<WorkerAvailability> parse_worker_availability(std::string_view name);

/// @brief Transient, in-memory state of one worker.
///
/// Never persisted. Created lazily (offline, no tasks) on first reference.
/// @ingroup core_registry
struct WorkerState {
    WorkerId worker_id{0};
    GeoPoint location;
    WorkerAvailability availability{WorkerAvailability::Offline};
    uint32_t active_task_count{0};
    TimePoint last_heartbeat;
    std::optional<TaskId> current_task;
};

/// @brief Concurrency-safe keyed store of live worker state.
///
/// The map is split into a fixed number of shards, each guarded by its own
/// reader/writer lock, so discovery and scoring can read many workers
/// concurrently while heartbeats and offer outcomes write to others.
/// Readers always receive copies; no reference into the map escapes a lock.
///
/// One registry instance is owned by the host and injected into the
/// allocation engine.
///
/// @see AllocationEngine
/// @ingroup core_registry
class WorkerStateRegistry {
public:
    static constexpr std::size_t SHARD_COUNT = 16;

    WorkerStateRegistry() = default;

    WorkerStateRegistry(const WorkerStateRegistry&) = delete;
    WorkerStateRegistry& operator=(const WorkerStateRegistry&) = delete;
    WorkerStateRegistry(WorkerStateRegistry&&) = delete;
    WorkerStateRegistry& operator=(WorkerStateRegistry&&) = delete;

    /// @brief Snapshot of a worker's state, or std::nullopt if never seen.
    [[nodiscard]] std::optional<WorkerState> find(WorkerId worker_id) const;

    /// @brief Record a location heartbeat.
    /// @param worker_id  Worker reporting its position.
    /// @param location   New position.
    /// @param now        Heartbeat time.
    void update_location(WorkerId worker_id, GeoPoint location, TimePoint now);

    /// @brief Change a worker's availability (does not refresh the heartbeat).
    void set_availability(WorkerId worker_id, WorkerAvailability availability, TimePoint now);

    /// @brief Count a newly accepted task against the worker.
    ///
    /// Increments the active task count and sets the current task.
    void assign_task(WorkerId worker_id, TaskId task_id, TimePoint now);

    /// @brief Release a task that left the accepted/in-progress states.
    ///
    /// Decrements the active task count (never below zero) and clears the
    /// current task when it matches @p task_id.
    /// @return false if the worker is unknown or had no active task.
    bool release_task(WorkerId worker_id, TaskId task_id);

    /// @brief Flip every online or busy worker whose last heartbeat is
    ///        older than @p cutoff to offline.
    /// @return The workers that were flipped, in ascending id order.
    std::vector<WorkerId> mark_stale_offline(TimePoint cutoff);

    /// @brief Number of workers currently tracked.
    [[nodiscard]] std::size_t size() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<WorkerId, WorkerState> states;
    };

    [[nodiscard]] Shard& shard_for(WorkerId worker_id) noexcept;
    [[nodiscard]] const Shard& shard_for(WorkerId worker_id) const noexcept;

    // Caller must hold the shard's exclusive lock.
    static WorkerState& get_or_create(Shard& shard, WorkerId worker_id, TimePoint now);

    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace gigdispatch::core

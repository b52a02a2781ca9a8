#include <gigdispatch/core/worker_state_registry.hpp>

#include <algorithm>
#include <array>
#include <mutex>
#include <utility>

namespace gigdispatch::core {

namespace {

constexpr std::array<std::pair<WorkerAvailability, std::string_view>, 3> AVAILABILITY_NAMES{{
    {WorkerAvailability::Online, "online"},
    {WorkerAvailability::Offline, "offline"},
    {WorkerAvailability::Busy, "busy"},
}};

} // anonymous namespace

std::string_view to_string(WorkerAvailability availability) noexcept {
    for (const auto& [key, name] : AVAILABILITY_NAMES) {
        if (key == availability) {
            return name;
        }
    }
    return "unknown";
}

std::optional<WorkerAvailability> parse_worker_availability(std::string_view name) {
    for (const auto& [key, entry] : AVAILABILITY_NAMES) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

WorkerStateRegistry::Shard& WorkerStateRegistry::shard_for(WorkerId worker_id) noexcept {
    return shards_[worker_id % SHARD_COUNT];
}

const WorkerStateRegistry::Shard& WorkerStateRegistry::shard_for(WorkerId worker_id) const noexcept {
    return shards_[worker_id % SHARD_COUNT];
}

WorkerState& WorkerStateRegistry::get_or_create(Shard& shard, WorkerId worker_id, TimePoint now) {
    auto [it, inserted] = shard.states.try_emplace(worker_id);
    if (inserted) {
        it->second.worker_id = worker_id;
        it->second.last_heartbeat = now;
    }
    return it->second;
}

std::optional<WorkerState> WorkerStateRegistry::find(WorkerId worker_id) const {
    const auto& shard = shard_for(worker_id);
    std::shared_lock lock(shard.mutex);
    auto it = shard.states.find(worker_id);
    if (it == shard.states.end()) {
        return std::nullopt;
    }
    return it->second;
}

void WorkerStateRegistry::update_location(WorkerId worker_id, GeoPoint location, TimePoint now) {
    auto& shard = shard_for(worker_id);
    std::unique_lock lock(shard.mutex);
    auto& state = get_or_create(shard, worker_id, now);
    state.location = location;
    state.last_heartbeat = now;
}

void WorkerStateRegistry::set_availability(WorkerId worker_id, WorkerAvailability availability,
                                           TimePoint now) {
    auto& shard = shard_for(worker_id);
    std::unique_lock lock(shard.mutex);
    get_or_create(shard, worker_id, now).availability = availability;
}

void WorkerStateRegistry::assign_task(WorkerId worker_id, TaskId task_id, TimePoint now) {
    auto& shard = shard_for(worker_id);
    std::unique_lock lock(shard.mutex);
    auto& state = get_or_create(shard, worker_id, now);
    ++state.active_task_count;
    state.current_task = task_id;
}

bool WorkerStateRegistry::release_task(WorkerId worker_id, TaskId task_id) {
    auto& shard = shard_for(worker_id);
    std::unique_lock lock(shard.mutex);
    auto it = shard.states.find(worker_id);
    if (it == shard.states.end() || it->second.active_task_count == 0) {
        return false;
    }
    auto& state = it->second;
    --state.active_task_count;
    if (state.current_task == task_id) {
        state.current_task.reset();
    }
    return true;
}

std::vector<WorkerId> WorkerStateRegistry::mark_stale_offline(TimePoint cutoff) {
    std::vector<WorkerId> flipped;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        for (auto& [id, state] : shard.states) {
            if (state.availability != WorkerAvailability::Offline && state.last_heartbeat < cutoff) {
                state.availability = WorkerAvailability::Offline;
                flipped.push_back(id);
            }
        }
    }
    std::sort(flipped.begin(), flipped.end());
    return flipped;
}

std::size_t WorkerStateRegistry::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        total += shard.states.size();
    }
    return total;
}

} // namespace gigdispatch::core

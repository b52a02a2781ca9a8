#pragma once

/// @file scenario_loader.hpp
/// @brief Dispatch scenarios: workers, their behaviour and the tasks to place.
/// @ingroup io_loaders

#include <gigdispatch/algo/strategy.hpp>

#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/types.hpp>
#include <gigdispatch/core/worker.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gigdispatch::io {

/// @brief How a simulated worker answers the offers it receives.
/// @ingroup io_loaders
enum class WorkerResponse {
    Accept,   ///< Accept after the response delay.
    Decline,  ///< Decline after the response delay.
    Ignore    ///< Never answer; the offer expires.
};

[[nodiscard]] std::string_view to_string(WorkerResponse response) noexcept;
[[nodiscard]] std::optional<WorkerResponse> parse_worker_response(std::string_view name);

/// @brief A worker of the scenario together with its live state and behaviour.
/// @ingroup io_loaders
struct ScenarioWorker {
    core::GigWorker profile;
    core::GeoPoint location;
    core::WorkerAvailability availability{core::WorkerAvailability::Online};
    WorkerResponse response{WorkerResponse::Accept};
    core::Duration response_delay{core::duration_from_seconds(5.0)};
    std::string decline_reason{"busy"};
};

/// @brief A task of the scenario and when it enters the system.
/// @ingroup io_loaders
struct ScenarioTask {
    core::Task task;
    core::TimePoint release;                 ///< Time of the first allocation.
    std::optional<algo::Strategy> strategy;  ///< Overrides the run's default strategy.
};

/// @brief Complete scenario description.
/// @ingroup io_loaders
struct ScenarioData {
    std::vector<ScenarioWorker> workers;
    std::vector<ScenarioTask> tasks;  ///< Sorted by release time, then id.
};

/// @brief Load a scenario from a JSON file.
///
/// @code{.json}
/// {
///   "workers": [
///     {"id": 1, "type": "driver", "status": "active", "verification": "approved",
///      "rating": 4.8, "completed_tasks": 200, "acceptance_rate": 0.9, "on_time_rate": 0.95,
///      "vehicle": {"type": "van", "capacity_kg": 500},
///      "preferences": {"task_types": ["delivery"], "accept_cod": true},
///      "location": {"lat": 6.5244, "lon": 3.3792},
///      "availability": "online", "response": "accept", "response_delay": 5}
///   ],
///   "tasks": [
///     {"id": 1, "type": "delivery", "weight_kg": 5, "collection_amount": 0,
///      "pickup": {"label": "Depot", "lat": 6.52, "lon": 3.37},
///      "dropoff": {"label": "Shop", "lat": 6.53, "lon": 3.38},
///      "release": 0, "strategy": "broadcast"}
///   ]
/// }
/// @endcode
///
/// Worker fields other than `id`, `type` and `location` are optional.
/// Task fields other than `id`, `type` and `dropoff` are optional.
/// `collection_amount` is in minor currency units.
///
/// @throws LoaderError on unreadable files, malformed JSON, unknown enum
///         names, duplicate ids or out-of-range values.
/// @ingroup io_loaders
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
/// @see load_scenario
ScenarioData load_scenario_from_string(std::string_view json);

} // namespace gigdispatch::io

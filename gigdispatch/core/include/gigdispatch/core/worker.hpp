#pragma once

#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gigdispatch::core {

/// @brief Capability class of a field worker.
/// @ingroup core_model
enum class WorkerType {
    Driver,
    Rider,
    Cyclist,
    Collector,
    Surveyor,
    Merchandiser,
    Walker
};

/// @brief Account status managed by the worker-profile service.
/// @ingroup core_model
enum class WorkerStatus {
    Active,
    Suspended,
    Deactivated,
    PendingOnboarding
};

/// @brief KYC verification outcome.
/// @ingroup core_model
enum class VerificationStatus {
    Pending,
    Approved,
    Rejected
};

/// @brief Vehicle a worker uses for weight-bearing tasks.
/// @ingroup core_model
struct Vehicle {
    std::string type;        ///< Vehicle kind passed to ETA estimation (e.g. "van").
    double capacity_kg{0.0}; ///< Maximum load in kilograms.
};

/// @brief Task preferences declared by the worker.
/// @ingroup core_model
struct TaskPreferences {
    std::vector<TaskType> preferred_types; ///< Empty means every task type.
    bool accept_cod{false};                ///< Willing to collect cash on delivery.
};

/// @brief Read-only profile of a gig worker.
///
/// Owned and updated by the external worker-profile service; the dispatch
/// engine never mutates it. Live location and availability are tracked
/// separately in the WorkerStateRegistry.
///
/// @see WorkerStateRegistry, WorkerState
/// @ingroup core_model
struct GigWorker {
    WorkerId id{0};
    WorkerType type{WorkerType::Driver};
    WorkerStatus status{WorkerStatus::Active};
    VerificationStatus verification_status{VerificationStatus::Pending};
    double rating{0.0};           ///< Average rating in [0, 5].
    uint64_t completed_tasks{0};
    double acceptance_rate{0.0};  ///< Share of offers accepted, in [0, 1].
    double on_time_rate{0.0};     ///< Share of tasks completed on time, in [0, 1].
    std::optional<Vehicle> vehicle;
    TaskPreferences preferences;

    /// @brief True when the preference list is empty or contains @p task_type.
    [[nodiscard]] bool accepts_task_type(TaskType task_type) const;

    /// @brief Vehicle type for ETA estimation ("motorcycle" when unknown).
    [[nodiscard]] std::string_view vehicle_type() const noexcept;
};

[[nodiscard]] std::string_view to_string(WorkerType type) noexcept;
[[nodiscard]] std::string_view to_string(WorkerStatus status) noexcept;
[[nodiscard]] std::string_view to_string(VerificationStatus status) noexcept;

/// @brief Parse the lowercase name of a worker type.
/// @return The type, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<WorkerType> parse_worker_type(std::string_view name);
[[nodiscard]] std::optional<WorkerStatus> parse_worker_status(std::string_view name);
[[nodiscard]] std::optional<VerificationStatus> parse_verification_status(std::string_view name);

} // namespace gigdispatch::core

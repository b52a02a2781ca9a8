#pragma once

#include <gigdispatch/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gigdispatch::core {

/// @brief Category of field work.
/// @ingroup core_model
enum class TaskType {
    Delivery,
    Collection,
    Survey,
    Merchandising
};

/// @brief Task lifecycle status.
///
/// The engine drives pending -> offered -> accepted. Later states are owned
/// by the execution service.
/// @ingroup core_model
enum class TaskStatus {
    Pending,
    Offered,
    Accepted,
    InProgress,
    Completed,
    Cancelled,
    Failed
};

/// @brief A pickup or dropoff stop.
/// @ingroup core_model
struct Address {
    std::string label;
    GeoPoint location;
};

/// @brief A unit of field work to be matched with a worker.
///
/// Created in Pending by the upstream order/collection service.
/// @ingroup core_model
struct Task {
    TaskId id{0};
    TaskType type{TaskType::Delivery};
    std::optional<Address> pickup;
    Address dropoff;
    double total_weight_kg{0.0};
    Money collection_amount{};    ///< Cash to collect on delivery (zero when none).
    TaskStatus status{TaskStatus::Pending};
    std::optional<WorkerId> assigned_worker;

    /// @brief Location used for matching: pickup when present, else dropoff.
    [[nodiscard]] GeoPoint effective_location() const noexcept;

    /// @brief True while the task can still receive offers (pending or offered).
    [[nodiscard]] bool is_offerable() const noexcept;
};

[[nodiscard]] std::string_view to_string(TaskType type) noexcept;
[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::optional<TaskType> parse_task_type(std::string_view name);
[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view name);

} // namespace gigdispatch::core

#include <gigdispatch/core/task.hpp>

#include <array>
#include <utility>

namespace gigdispatch::core {

namespace {

constexpr std::array<std::pair<TaskType, std::string_view>, 4> TASK_TYPE_NAMES{{
    {TaskType::Delivery, "delivery"},
    {TaskType::Collection, "collection"},
    {TaskType::Survey, "survey"},
    {TaskType::Merchandising, "merchandising"},
}};

constexpr std::array<std::pair<TaskStatus, std::string_view>, 7> TASK_STATUS_NAMES{{
    {TaskStatus::Pending, "pending"},
    {TaskStatus::Offered, "offered"},
    {TaskStatus::Accepted, "accepted"},
    {TaskStatus::InProgress, "in_progress"},
    {TaskStatus::Completed, "completed"},
    {TaskStatus::Cancelled, "cancelled"},
    {TaskStatus::Failed, "failed"},
}};

} // anonymous namespace

GeoPoint Task::effective_location() const noexcept {
    if (pickup) {
        return pickup->location;
    }
    return dropoff.location;
}

bool Task::is_offerable() const noexcept {
    return status == TaskStatus::Pending || status == TaskStatus::Offered;
}

std::string_view to_string(TaskType type) noexcept {
    for (const auto& [key, name] : TASK_TYPE_NAMES) {
        if (key == type) {
            return name;
        }
    }
    return "unknown";
}

std::string_view to_string(TaskStatus status) noexcept {
    for (const auto& [key, name] : TASK_STATUS_NAMES) {
        if (key == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<TaskType> parse_task_type(std::string_view name) {
    for (const auto& [key, entry] : TASK_TYPE_NAMES) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<TaskStatus> parse_task_status(std::string_view name) {
    for (const auto& [key, entry] : TASK_STATUS_NAMES) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace gigdispatch::core

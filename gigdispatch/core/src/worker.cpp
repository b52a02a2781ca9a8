#include <gigdispatch/core/worker.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace gigdispatch::core {

namespace {

constexpr std::array<std::pair<WorkerType, std::string_view>, 7> WORKER_TYPE_NAMES{{
    {WorkerType::Driver, "driver"},
    {WorkerType::Rider, "rider"},
    {WorkerType::Cyclist, "cyclist"},
    {WorkerType::Collector, "collector"},
    {WorkerType::Surveyor, "surveyor"},
    {WorkerType::Merchandiser, "merchandiser"},
    {WorkerType::Walker, "walker"},
}};

constexpr std::array<std::pair<WorkerStatus, std::string_view>, 4> WORKER_STATUS_NAMES{{
    {WorkerStatus::Active, "active"},
    {WorkerStatus::Suspended, "suspended"},
    {WorkerStatus::Deactivated, "deactivated"},
    {WorkerStatus::PendingOnboarding, "pending_onboarding"},
}};

constexpr std::array<std::pair<VerificationStatus, std::string_view>, 3> VERIFICATION_NAMES{{
    {VerificationStatus::Pending, "pending"},
    {VerificationStatus::Approved, "approved"},
    {VerificationStatus::Rejected, "rejected"},
}};

template<typename E, std::size_t N>
std::string_view name_of(const std::array<std::pair<E, std::string_view>, N>& table, E value) noexcept {
    for (const auto& [key, name] : table) {
        if (key == value) {
            return name;
        }
    }
    return "unknown";
}

template<typename E, std::size_t N>
std::optional<E> value_of(const std::array<std::pair<E, std::string_view>, N>& table,
                          std::string_view name) {
    for (const auto& [key, entry] : table) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

bool GigWorker::accepts_task_type(TaskType task_type) const {
    if (preferences.preferred_types.empty()) {
        return true;
    }
    return std::find(preferences.preferred_types.begin(), preferences.preferred_types.end(),
                     task_type) != preferences.preferred_types.end();
}

std::string_view GigWorker::vehicle_type() const noexcept {
    if (vehicle && !vehicle->type.empty()) {
        return vehicle->type;
    }
    return "motorcycle";
}

std::string_view to_string(WorkerType type) noexcept {
    return name_of(WORKER_TYPE_NAMES, type);
}

std::string_view to_string(WorkerStatus status) noexcept {
    return name_of(WORKER_STATUS_NAMES, status);
}

std::string_view to_string(VerificationStatus status) noexcept {
    return name_of(VERIFICATION_NAMES, status);
}

std::optional<WorkerType> parse_worker_type(std::string_view name) {
    return value_of(WORKER_TYPE_NAMES, name);
}

std::optional<WorkerStatus> parse_worker_status(std::string_view name) {
    return value_of(WORKER_STATUS_NAMES, name);
}

std::optional<VerificationStatus> parse_verification_status(std::string_view name) {
    return value_of(VERIFICATION_NAMES, name);
}

} // namespace gigdispatch::core

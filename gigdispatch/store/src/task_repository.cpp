#include <gigdispatch/store/task_repository.hpp>

#include <gigdispatch/core/error.hpp>

#include <string>
#include <utility>

namespace gigdispatch::store {

void InMemoryTaskRepository::upsert(core::Task task) {
    std::lock_guard lock(mutex_);
    core::TaskId id = task.id;
    tasks_.insert_or_assign(id, std::move(task));
}

void InMemoryTaskRepository::set_status(core::TaskId task_id, core::TaskStatus status) {
    std::lock_guard lock(mutex_);
    locate(task_id).status = status;
}

std::vector<core::Task> InMemoryTaskRepository::all() const {
    std::lock_guard lock(mutex_);
    std::vector<core::Task> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        result.push_back(task);
    }
    return result;
}

core::Task InMemoryTaskRepository::get_by_id(const core::CallContext& /*ctx*/,
                                             core::TaskId task_id) {
    std::lock_guard lock(mutex_);
    return locate(task_id);
}

bool InMemoryTaskRepository::update_status(const core::CallContext& /*ctx*/, core::TaskId task_id,
                                           core::TaskStatus from, core::TaskStatus to) {
    std::lock_guard lock(mutex_);
    auto& task = locate(task_id);
    if (task.status != from) {
        return false;
    }
    task.status = to;
    return true;
}

bool InMemoryTaskRepository::assign_worker(const core::CallContext& /*ctx*/, core::TaskId task_id,
                                           core::WorkerId worker_id) {
    std::lock_guard lock(mutex_);
    auto& task = locate(task_id);
    if (!task.is_offerable() || task.assigned_worker) {
        return false;
    }
    task.assigned_worker = worker_id;
    task.status = core::TaskStatus::Accepted;
    return true;
}

bool InMemoryTaskRepository::release_assignment(const core::CallContext& /*ctx*/,
                                                core::TaskId task_id, core::WorkerId worker_id) {
    std::lock_guard lock(mutex_);
    auto& task = locate(task_id);
    if (task.status != core::TaskStatus::Accepted || task.assigned_worker != worker_id) {
        return false;
    }
    task.assigned_worker.reset();
    task.status = core::TaskStatus::Offered;
    return true;
}

core::Task& InMemoryTaskRepository::locate(core::TaskId task_id) {
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        throw core::NotFoundError("task " + std::to_string(task_id) + " not found");
    }
    return it->second;
}

} // namespace gigdispatch::store

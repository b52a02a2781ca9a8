#pragma once

#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/task.hpp>

#include <map>
#include <mutex>
#include <vector>

namespace gigdispatch::store {

/// @brief Tasks held in memory.
///
/// Every conditional update runs under one mutex, which gives
/// assign_worker() the compare-and-set semantics the engine relies on.
///
/// @ingroup store
class InMemoryTaskRepository : public core::TaskRepository {
public:
    /// @brief Insert or replace a task.
    void upsert(core::Task task);

    /// @brief Host-side status change (e.g. completion), unconditional.
    /// @throws core::NotFoundError if @p task_id is unknown.
    void set_status(core::TaskId task_id, core::TaskStatus status);

    /// @brief Snapshot of every stored task in ascending id order.
    [[nodiscard]] std::vector<core::Task> all() const;

    core::Task get_by_id(const core::CallContext& ctx, core::TaskId task_id) override;
    bool update_status(const core::CallContext& ctx, core::TaskId task_id, core::TaskStatus from,
                       core::TaskStatus to) override;
    bool assign_worker(const core::CallContext& ctx, core::TaskId task_id,
                       core::WorkerId worker_id) override;
    bool release_assignment(const core::CallContext& ctx, core::TaskId task_id,
                            core::WorkerId worker_id) override;

private:
    // Caller must hold mutex_.
    core::Task& locate(core::TaskId task_id);

    mutable std::mutex mutex_;
    std::map<core::TaskId, core::Task> tasks_;
};

} // namespace gigdispatch::store

#pragma once

#include <gigdispatch/core/collaborators.hpp>

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace gigdispatch::store {

/// @brief One message captured by RecordingNotifier.
/// @ingroup store
struct Notification {
    enum class Kind { Offer, TaskUpdate };

    Kind kind{Kind::Offer};
    core::WorkerId worker_id{0};
    core::TaskId task_id{0};
    core::OfferId offer_id{0};   ///< Zero for task updates.
    std::string message;         ///< Empty for offers.
};

/// @brief WorkerNotifier that keeps every message in memory.
///
/// Used by the simulator to drive worker responses and by tests to observe
/// what workers were told.
///
/// @ingroup store
class RecordingNotifier : public core::WorkerNotifier {
public:
    void push_offer(const core::CallContext& ctx, core::WorkerId worker_id,
                    const core::TaskOffer& offer, const core::Task& task) override;
    void push_task_update(const core::CallContext& ctx, core::WorkerId worker_id,
                          const core::Task& task, std::string_view message) override;

    /// @brief Copy of every captured message in arrival order.
    [[nodiscard]] std::vector<Notification> notifications() const;

    /// @brief Remove and return every captured message.
    std::vector<Notification> drain();

    [[nodiscard]] std::size_t count(Notification::Kind kind) const;

private:
    mutable std::mutex mutex_;
    std::vector<Notification> notifications_;
};

} // namespace gigdispatch::store

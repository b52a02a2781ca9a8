#include <gigdispatch/store/notifier.hpp>

#include <algorithm>
#include <utility>

namespace gigdispatch::store {

void RecordingNotifier::push_offer(const core::CallContext& /*ctx*/, core::WorkerId worker_id,
                                   const core::TaskOffer& offer, const core::Task& task) {
    std::lock_guard lock(mutex_);
    notifications_.push_back(Notification{
        .kind = Notification::Kind::Offer,
        .worker_id = worker_id,
        .task_id = task.id,
        .offer_id = offer.id,
        .message = {},
    });
}

void RecordingNotifier::push_task_update(const core::CallContext& /*ctx*/, core::WorkerId worker_id,
                                         const core::Task& task, std::string_view message) {
    std::lock_guard lock(mutex_);
    notifications_.push_back(Notification{
        .kind = Notification::Kind::TaskUpdate,
        .worker_id = worker_id,
        .task_id = task.id,
        .offer_id = 0,
        .message = std::string(message),
    });
}

std::vector<Notification> RecordingNotifier::notifications() const {
    std::lock_guard lock(mutex_);
    return notifications_;
}

std::vector<Notification> RecordingNotifier::drain() {
    std::lock_guard lock(mutex_);
    return std::exchange(notifications_, {});
}

std::size_t RecordingNotifier::count(Notification::Kind kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(notifications_.begin(), notifications_.end(),
                      [kind](const Notification& n) { return n.kind == kind; }));
}

} // namespace gigdispatch::store

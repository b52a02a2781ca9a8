#include <gigdispatch/store/offer_repository.hpp>

#include <gigdispatch/core/error.hpp>

#include <string>

namespace gigdispatch::store {

std::vector<core::TaskOffer> InMemoryOfferRepository::all() const {
    std::lock_guard lock(mutex_);
    std::vector<core::TaskOffer> result;
    result.reserve(offers_.size());
    for (const auto& [id, offer] : offers_) {
        result.push_back(offer);
    }
    return result;
}

std::size_t InMemoryOfferRepository::size() const {
    std::lock_guard lock(mutex_);
    return offers_.size();
}

std::size_t InMemoryOfferRepository::created_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(next_id_ - 1);
}

core::OfferId InMemoryOfferRepository::create(const core::CallContext& /*ctx*/,
                                              const core::TaskOffer& offer) {
    std::lock_guard lock(mutex_);
    for (const auto& [id, stored] : offers_) {
        if (stored.task_id == offer.task_id && stored.worker_id == offer.worker_id &&
            stored.status == core::OfferStatus::Pending) {
            throw core::InvalidStateError("worker " + std::to_string(offer.worker_id) +
                                          " already holds pending offer " + std::to_string(id) +
                                          " for task " + std::to_string(offer.task_id));
        }
    }
    core::OfferId id = next_id_++;
    auto& stored = offers_[id];
    stored = offer;
    stored.id = id;
    return id;
}

core::TaskOffer InMemoryOfferRepository::get_by_id(const core::CallContext& /*ctx*/,
                                                   core::OfferId offer_id) {
    std::lock_guard lock(mutex_);
    auto it = offers_.find(offer_id);
    if (it == offers_.end()) {
        throw core::NotFoundError("offer " + std::to_string(offer_id) + " not found");
    }
    return it->second;
}

std::vector<core::TaskOffer> InMemoryOfferRepository::list_for_task(const core::CallContext& /*ctx*/,
                                                                    core::TaskId task_id) {
    std::lock_guard lock(mutex_);
    std::vector<core::TaskOffer> result;
    for (const auto& [id, offer] : offers_) {
        if (offer.task_id == task_id) {
            result.push_back(offer);
        }
    }
    return result;
}

std::vector<core::TaskOffer> InMemoryOfferRepository::list_active_for_task(
    const core::CallContext& /*ctx*/, core::TaskId task_id, core::TimePoint now) {
    std::lock_guard lock(mutex_);
    std::vector<core::TaskOffer> result;
    for (const auto& [id, offer] : offers_) {
        if (offer.task_id == task_id && offer.is_active_at(now)) {
            result.push_back(offer);
        }
    }
    return result;
}

std::vector<core::TaskOffer> InMemoryOfferRepository::list_active_for_worker(
    const core::CallContext& /*ctx*/, core::WorkerId worker_id, core::TimePoint now) {
    std::lock_guard lock(mutex_);
    std::vector<core::TaskOffer> result;
    for (const auto& [id, offer] : offers_) {
        if (offer.worker_id == worker_id && offer.is_active_at(now)) {
            result.push_back(offer);
        }
    }
    return result;
}

bool InMemoryOfferRepository::transition(const core::CallContext& /*ctx*/, core::OfferId offer_id,
                                         core::OfferStatus from, core::OfferStatus to,
                                         core::TimePoint at, std::string_view reason) {
    std::lock_guard lock(mutex_);
    auto it = offers_.find(offer_id);
    if (it == offers_.end()) {
        throw core::NotFoundError("offer " + std::to_string(offer_id) + " not found");
    }
    auto& offer = it->second;
    if (offer.status != from) {
        return false;
    }
    offer.status = to;
    offer.responded_at = at;
    if (to == core::OfferStatus::Declined && !reason.empty()) {
        offer.decline_reason = std::string(reason);
    }
    return true;
}

std::vector<core::TaskOffer> InMemoryOfferRepository::expire_stale(const core::CallContext& /*ctx*/,
                                                                   core::TimePoint now) {
    std::lock_guard lock(mutex_);
    std::vector<core::TaskOffer> expired;
    for (auto& [id, offer] : offers_) {
        if (offer.status == core::OfferStatus::Pending && offer.is_expired_at(now)) {
            offer.status = core::OfferStatus::Expired;
            offer.responded_at = now;
            expired.push_back(offer);
        }
    }
    return expired;
}

} // namespace gigdispatch::store

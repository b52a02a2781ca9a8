#pragma once

#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/offer.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace gigdispatch::store {

/// @brief Offers held in memory.
///
/// Ids come from a sequence starting at 1. transition() and expire_stale()
/// are compare-and-set on the status under one mutex. create() refuses a
/// second pending offer for the same task and worker. Listing operations
/// return offers in ascending id order.
///
/// create() is virtual so tests can inject storage failures.
///
/// @ingroup store
class InMemoryOfferRepository : public core::OfferRepository {
public:
    /// @brief Snapshot of every stored offer in ascending id order.
    [[nodiscard]] std::vector<core::TaskOffer> all() const;

    [[nodiscard]] std::size_t size() const;

    /// @brief Number of successful create() calls.
    [[nodiscard]] std::size_t created_count() const;

    core::OfferId create(const core::CallContext& ctx, const core::TaskOffer& offer) override;
    core::TaskOffer get_by_id(const core::CallContext& ctx, core::OfferId offer_id) override;
    std::vector<core::TaskOffer> list_for_task(const core::CallContext& ctx,
                                               core::TaskId task_id) override;
    std::vector<core::TaskOffer> list_active_for_task(const core::CallContext& ctx,
                                                      core::TaskId task_id,
                                                      core::TimePoint now) override;
    std::vector<core::TaskOffer> list_active_for_worker(const core::CallContext& ctx,
                                                        core::WorkerId worker_id,
                                                        core::TimePoint now) override;
    bool transition(const core::CallContext& ctx, core::OfferId offer_id, core::OfferStatus from,
                    core::OfferStatus to, core::TimePoint at, std::string_view reason = {}) override;
    std::vector<core::TaskOffer> expire_stale(const core::CallContext& ctx,
                                              core::TimePoint now) override;

private:
    mutable std::mutex mutex_;
    std::map<core::OfferId, core::TaskOffer> offers_;
    core::OfferId next_id_{1};
};

} // namespace gigdispatch::store

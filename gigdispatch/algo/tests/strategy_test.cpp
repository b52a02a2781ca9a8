#include "dispatch_fixture.hpp"

#include <gigdispatch/algo/offer_dispatcher.hpp>
#include <gigdispatch/algo/strategy.hpp>

#include <gigdispatch/core/error.hpp>
#include <gigdispatch/core/tracer.hpp>

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace gigdispatch;
using namespace gigdispatch::algo;
using gigdispatch::fixtures::DispatchWorld;
using gigdispatch::fixtures::make_task;
using gigdispatch::fixtures::make_worker;

namespace {

// Fails to persist offers addressed to the listed workers
class FlakyOfferRepository : public store::InMemoryOfferRepository {
public:
    explicit FlakyOfferRepository(std::set<core::WorkerId> failing)
        : failing_(std::move(failing)) {}

    core::OfferId create(const core::CallContext& ctx, const core::TaskOffer& offer) override {
        if (failing_.contains(offer.worker_id)) {
            throw std::runtime_error("write timeout");
        }
        return InMemoryOfferRepository::create(ctx, offer);
    }

private:
    std::set<core::WorkerId> failing_;
};

class UnreachableNotifier : public core::WorkerNotifier {
public:
    void push_offer(const core::CallContext& /*ctx*/, core::WorkerId /*worker_id*/,
                    const core::TaskOffer& /*offer*/, const core::Task& /*task*/) override {
        throw std::runtime_error("device offline");
    }
    void push_task_update(const core::CallContext& /*ctx*/, core::WorkerId /*worker_id*/,
                          const core::Task& /*task*/, std::string_view /*message*/) override {
        throw std::runtime_error("device offline");
    }
};

std::vector<Candidate> ranked_candidates(std::size_t count) {
    std::vector<Candidate> candidates;
    for (std::size_t i = 0; i < count; ++i) {
        Candidate c;
        c.worker = make_worker(static_cast<core::WorkerId>(i + 1));
        c.state.worker_id = c.worker.id;
        c.distance_km = 1.0 + static_cast<double>(i);
        c.eta_minutes = 2 + static_cast<int>(i);
        c.earning.base = core::Money{500};
        c.earning.bonus = core::Money{50};
        c.earning.total = core::Money{900};
        c.score = 90.0 - static_cast<double>(i);
        candidates.push_back(c);
    }
    return candidates;
}

} // anonymous namespace

// ============================================================================
// Names and table
// ============================================================================

TEST(StrategyNamesTest, RoundTrip) {
    for (auto s : {Strategy::Nearest, Strategy::Broadcast, Strategy::AIOptimized}) {
        EXPECT_EQ(parse_strategy(to_string(s)), s);
    }
    EXPECT_EQ(to_string(Strategy::AIOptimized), "ai_optimized");
    EXPECT_FALSE(parse_strategy("round_robin").has_value());
    EXPECT_EQ(to_string(AllocationFailure::NoEligibleWorkers), "no_eligible_workers");
}

TEST(StrategyTableTest, NearestUsesFixedWeightsOthersUseConfig) {
    AllocationConfig config;
    config.distance_weight = 0.7;

    EXPECT_DOUBLE_EQ(strategy_entry(Strategy::Nearest).weights(config).distance, 0.5);
    EXPECT_DOUBLE_EQ(strategy_entry(Strategy::Broadcast).weights(config).distance, 0.7);
    EXPECT_DOUBLE_EQ(strategy_entry(Strategy::AIOptimized).weights(config).distance, 0.7);
    EXPECT_EQ(strategy_entry(Strategy::Broadcast).execute, &execute_broadcast);
}

TEST(AllocationResultTest, Partial) {
    AllocationResult r;
    r.offers_attempted = 3;
    r.offers_created = 2;
    EXPECT_TRUE(r.partial());
    r.offers_created = 3;
    EXPECT_FALSE(r.partial());
    r.offers_created = 0;
    EXPECT_FALSE(r.partial());
}

// ============================================================================
// Execution
// ============================================================================

class StrategyExecutionTest : public ::testing::Test {
protected:
    StrategyExecutionTest()
        : tracer(world.clock, &world.trace) {
        world.add_task(task);
    }

    AllocationResult run(StrategyFn fn, core::OfferRepository& offers, std::size_t count,
                         std::size_t fan_out, core::WorkerNotifier* notifier = nullptr) {
        OfferDispatcher dispatcher(config, world.clock, tracer, offers, world.tasks,
                                   notifier != nullptr ? *notifier : world.notifier);
        StrategyContext ctx{
            .call = world.ctx,
            .config = config,
            .dispatcher = dispatcher,
            .fan_out = fan_out,
        };
        auto candidates = ranked_candidates(count);
        return fn(ctx, task, candidates);
    }

    AllocationConfig config;
    DispatchWorld world;
    core::Tracer tracer;
    core::Task task = make_task(42);
};

TEST_F(StrategyExecutionTest, NearestOffersOnlyTheTopCandidate) {
    auto result = run(&execute_nearest, world.offers, 4, 1);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.strategy, Strategy::Nearest);
    EXPECT_EQ(result.offers_attempted, 1U);
    EXPECT_EQ(result.offers_created, 1U);
    ASSERT_EQ(result.worker_ids.size(), 1U);
    EXPECT_EQ(result.worker_ids[0], 1U);
    ASSERT_TRUE(result.earning.has_value());
    EXPECT_EQ(result.earning->total.minor, 900);

    auto offers = world.offers.all();
    ASSERT_EQ(offers.size(), 1U);
    EXPECT_EQ(offers[0].id, result.offer_ids[0]);
    EXPECT_EQ(offers[0].status, core::OfferStatus::Pending);
    EXPECT_EQ(offers[0].base_earning.minor, 500);
    EXPECT_EQ(offers[0].bonus_earning.minor, 50);
    EXPECT_EQ(offers[0].estimated_minutes, 2);
    EXPECT_EQ(offers[0].offered_at, world.clock.now());
    EXPECT_EQ(offers[0].expires_at - offers[0].offered_at,
              core::duration_from_seconds(config.offer_timeout_seconds));

    EXPECT_EQ(world.tasks.get_by_id(world.ctx, 42).status, core::TaskStatus::Offered);
    EXPECT_EQ(world.notifier.count(store::Notification::Kind::Offer), 1U);
    EXPECT_EQ(world.trace.count("task_offered"), 1U);
}

TEST_F(StrategyExecutionTest, EmptyCandidateListThrows) {
    EXPECT_THROW(run(&execute_nearest, world.offers, 0, 1), core::NoEligibleWorkersError);
    EXPECT_THROW(run(&execute_broadcast, world.offers, 0, 5), core::NoEligibleWorkersError);
    EXPECT_EQ(world.offers.size(), 0U);
}

TEST_F(StrategyExecutionTest, BroadcastStopsAtFanOut) {
    auto result = run(&execute_broadcast, world.offers, 7, 5);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.strategy, Strategy::Broadcast);
    EXPECT_EQ(result.offers_created, 5U);
    EXPECT_EQ(result.message, "broadcast to 5 of 5 workers");
    EXPECT_FALSE(result.earning.has_value());

    // The five best candidates, in rank order
    EXPECT_EQ(result.worker_ids, (std::vector<core::WorkerId>{1, 2, 3, 4, 5}));
    EXPECT_EQ(world.offers.size(), 5U);
    EXPECT_EQ(world.trace.count("task_offered"), 1U);
}

TEST_F(StrategyExecutionTest, BroadcastToFewerCandidatesThanFanOut) {
    auto result = run(&execute_broadcast, world.offers, 2, 5);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.offers_attempted, 2U);
    EXPECT_EQ(result.offers_created, 2U);
}

TEST_F(StrategyExecutionTest, BroadcastPartialFailureStillSucceeds) {
    FlakyOfferRepository offers({2});

    auto result = run(&execute_broadcast, offers, 3, 3);

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.partial());
    EXPECT_EQ(result.offers_attempted, 3U);
    EXPECT_EQ(result.offers_created, 2U);
    EXPECT_EQ(result.worker_ids, (std::vector<core::WorkerId>{1, 3}));
    EXPECT_EQ(result.message, "broadcast to 2 of 3 workers");
    EXPECT_EQ(world.trace.count("offer_create_failed"), 1U);
}

TEST_F(StrategyExecutionTest, BroadcastWithNoOfferCreatedFails) {
    FlakyOfferRepository offers({1, 2});

    auto result = run(&execute_broadcast, offers, 2, 5);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, AllocationFailure::OfferCreationFailed);
    EXPECT_TRUE(result.offer_ids.empty());
    EXPECT_EQ(world.tasks.get_by_id(world.ctx, 42).status, core::TaskStatus::Pending);
    EXPECT_EQ(world.trace.count("task_offered"), 0U);
}

TEST_F(StrategyExecutionTest, NearestCreateFailureLeavesTaskPending) {
    FlakyOfferRepository offers({1});

    auto result = run(&execute_nearest, offers, 3, 1);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, AllocationFailure::OfferCreationFailed);
    EXPECT_EQ(world.tasks.get_by_id(world.ctx, 42).status, core::TaskStatus::Pending);
}

TEST_F(StrategyExecutionTest, NotificationFailureKeepsOffer) {
    UnreachableNotifier notifier;

    auto result = run(&execute_nearest, world.offers, 1, 1, &notifier);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(world.offers.size(), 1U);
    EXPECT_EQ(world.trace.count("offer_notify_failed"), 1U);
}

TEST_F(StrategyExecutionTest, AIOptimizedRunsNearest) {
    auto result = run(&execute_ai_optimized, world.offers, 3, 5);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.strategy, Strategy::AIOptimized);
    EXPECT_EQ(result.offers_created, 1U);
    EXPECT_EQ(result.worker_ids, (std::vector<core::WorkerId>{1}));
}

TEST_F(StrategyExecutionTest, MarkOfferedNeverOverwritesAcceptance) {
    OfferDispatcher dispatcher(config, world.clock, tracer, world.offers, world.tasks,
                               world.notifier);

    // Accepted between dispatch and mark_offered
    ASSERT_TRUE(world.tasks.assign_worker(world.ctx, 42, 1));
    dispatcher.mark_offered(world.ctx, task);

    EXPECT_EQ(world.tasks.get_by_id(world.ctx, 42).status, core::TaskStatus::Accepted);
    EXPECT_EQ(world.trace.count("task_offered"), 0U);
}

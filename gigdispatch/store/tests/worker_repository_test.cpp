#include <gigdispatch/store/geo_service.hpp>
#include <gigdispatch/store/notifier.hpp>
#include <gigdispatch/store/worker_repository.hpp>

#include <gigdispatch/core/error.hpp>

#include <gtest/gtest.h>

#include <array>

using namespace gigdispatch;

class WorkerRepositoryTest : public ::testing::Test {
protected:
    void add(core::WorkerId id, core::WorkerType type, core::GeoPoint at,
             core::WorkerAvailability availability = core::WorkerAvailability::Online) {
        core::GigWorker worker;
        worker.id = id;
        worker.type = type;
        repo.upsert(worker);
        registry.update_location(id, at, core::TimePoint{});
        registry.set_availability(id, availability, core::TimePoint{});
    }

    core::WorkerStateRegistry registry;
    store::HaversineGeoService geo;
    store::InMemoryWorkerRepository repo{registry, geo};
    core::CallContext ctx;
};

TEST_F(WorkerRepositoryTest, GetById) {
    add(1, core::WorkerType::Rider, core::GeoPoint{});
    EXPECT_EQ(repo.get_by_id(ctx, 1).type, core::WorkerType::Rider);
    EXPECT_THROW(repo.get_by_id(ctx, 2), core::NotFoundError);
    EXPECT_EQ(repo.size(), 1U);
}

TEST_F(WorkerRepositoryTest, RadiusSearchFiltersTypeAvailabilityAndDistance) {
    core::GeoPoint center{6.5, 3.4};
    add(4, core::WorkerType::Rider, core::GeoPoint{6.51, 3.4});
    add(2, core::WorkerType::Driver, core::GeoPoint{6.52, 3.4});
    add(3, core::WorkerType::Surveyor, core::GeoPoint{6.5, 3.4});
    add(5, core::WorkerType::Rider, core::GeoPoint{6.5, 3.4}, core::WorkerAvailability::Busy);
    add(6, core::WorkerType::Rider, core::GeoPoint{7.5, 3.4});

    std::array<core::WorkerType, 2> types{core::WorkerType::Rider, core::WorkerType::Driver};
    auto found = repo.find_online_within_radius(ctx, center, 10.0, types);

    ASSERT_EQ(found.size(), 2U);
    EXPECT_EQ(found[0].id, 2U);
    EXPECT_EQ(found[1].id, 4U);
}

TEST(RecordingNotifierTest, RecordsAndDrains) {
    store::RecordingNotifier notifier;
    core::CallContext ctx;
    core::Task task;
    task.id = 7;
    core::TaskOffer offer;
    offer.id = 3;

    notifier.push_offer(ctx, 1, offer, task);
    notifier.push_task_update(ctx, 2, task, "task no longer available");

    EXPECT_EQ(notifier.count(store::Notification::Kind::Offer), 1U);
    EXPECT_EQ(notifier.count(store::Notification::Kind::TaskUpdate), 1U);

    auto drained = notifier.drain();
    ASSERT_EQ(drained.size(), 2U);
    EXPECT_EQ(drained[0].offer_id, 3U);
    EXPECT_EQ(drained[1].worker_id, 2U);
    EXPECT_EQ(drained[1].message, "task no longer available");
    EXPECT_TRUE(notifier.notifications().empty());
}

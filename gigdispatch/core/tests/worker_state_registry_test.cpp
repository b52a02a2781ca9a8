#include <gigdispatch/core/worker_state_registry.hpp>

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace gigdispatch::core;

class WorkerStateRegistryTest : public ::testing::Test {
protected:
    WorkerStateRegistry registry;
    TimePoint t0 = time_from_seconds(100.0);
};

TEST_F(WorkerStateRegistryTest, UnknownWorkerHasNoState) {
    EXPECT_FALSE(registry.find(7).has_value());
    EXPECT_EQ(registry.size(), 0U);
}

TEST_F(WorkerStateRegistryTest, FirstReferenceCreatesOfflineState) {
    registry.update_location(7, GeoPoint{6.5, 3.4}, t0);

    auto state = registry.find(7);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->worker_id, 7U);
    EXPECT_EQ(state->availability, WorkerAvailability::Offline);
    EXPECT_EQ(state->location, (GeoPoint{6.5, 3.4}));
    EXPECT_EQ(state->last_heartbeat, t0);
    EXPECT_EQ(state->active_task_count, 0U);
    EXPECT_EQ(registry.size(), 1U);
}

TEST_F(WorkerStateRegistryTest, AvailabilityDoesNotRefreshHeartbeat) {
    registry.update_location(1, GeoPoint{}, t0);
    registry.set_availability(1, WorkerAvailability::Online, t0 + duration_from_seconds(50.0));

    auto state = registry.find(1);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->availability, WorkerAvailability::Online);
    EXPECT_EQ(state->last_heartbeat, t0);
}

TEST_F(WorkerStateRegistryTest, AssignAndReleaseTasks) {
    registry.assign_task(3, 10, t0);
    registry.assign_task(3, 11, t0);

    auto state = registry.find(3);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->active_task_count, 2U);
    EXPECT_EQ(state->current_task, TaskId{11});

    // Releasing a task that is not current keeps the current one
    EXPECT_TRUE(registry.release_task(3, 10));
    EXPECT_EQ(registry.find(3)->current_task, TaskId{11});

    EXPECT_TRUE(registry.release_task(3, 11));
    EXPECT_EQ(registry.find(3)->active_task_count, 0U);
    EXPECT_FALSE(registry.find(3)->current_task.has_value());

    // Never below zero
    EXPECT_FALSE(registry.release_task(3, 11));
    EXPECT_FALSE(registry.release_task(99, 11));
}

TEST_F(WorkerStateRegistryTest, StaleWorkersFlipOffline) {
    registry.update_location(5, GeoPoint{}, t0);
    registry.set_availability(5, WorkerAvailability::Online, t0);
    registry.update_location(2, GeoPoint{}, t0);
    registry.set_availability(2, WorkerAvailability::Busy, t0);
    registry.update_location(9, GeoPoint{}, t0 + duration_from_seconds(200.0));
    registry.set_availability(9, WorkerAvailability::Online, t0);
    registry.update_location(4, GeoPoint{}, t0);  // already offline

    auto flipped = registry.mark_stale_offline(t0 + duration_from_seconds(120.0));

    ASSERT_EQ(flipped.size(), 2U);
    EXPECT_EQ(flipped[0], 2U);
    EXPECT_EQ(flipped[1], 5U);
    EXPECT_EQ(registry.find(5)->availability, WorkerAvailability::Offline);
    EXPECT_EQ(registry.find(9)->availability, WorkerAvailability::Online);
}

TEST_F(WorkerStateRegistryTest, ConcurrentWritersKeepCountsConsistent) {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 500;

    std::vector<std::thread> threads;
    threads.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto worker = static_cast<WorkerId>(i % 40);
                registry.assign_task(worker, static_cast<TaskId>(t * PER_THREAD + i), t0);
                registry.update_location(worker, GeoPoint{6.0 + t * 0.01, 3.0}, t0);
                (void)registry.find(worker);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 40U);
    uint32_t total = 0;
    for (WorkerId id = 0; id < 40; ++id) {
        total += registry.find(id)->active_task_count;
    }
    EXPECT_EQ(total, static_cast<uint32_t>(THREADS * PER_THREAD));
}

TEST(WorkerAvailabilityTest, Names) {
    EXPECT_EQ(to_string(WorkerAvailability::Busy), "busy");
    EXPECT_EQ(parse_worker_availability("online"), WorkerAvailability::Online);
    EXPECT_FALSE(parse_worker_availability("away").has_value());
}

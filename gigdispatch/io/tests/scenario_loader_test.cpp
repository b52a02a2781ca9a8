#include <gigdispatch/io/error.hpp>
#include <gigdispatch/io/scenario_loader.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace gigdispatch;
using namespace gigdispatch::io;

namespace {

constexpr const char* FULL_SCENARIO = R"({
    "workers": [
        {
            "id": 1,
            "type": "rider",
            "rating": 4.6,
            "completed_tasks": 120,
            "acceptance_rate": 0.85,
            "on_time_rate": 0.9,
            "vehicle": {"type": "motorcycle", "capacity_kg": 20},
            "preferences": {"task_types": ["delivery", "collection"], "accept_cod": true},
            "location": {"lat": 6.52, "lon": 3.37},
            "response": "decline",
            "response_delay": 8,
            "decline_reason": "too far"
        },
        {
            "id": 2,
            "type": "surveyor",
            "status": "suspended",
            "verification": "pending",
            "location": {"lat": 6.50, "lon": 3.40},
            "availability": "busy"
        }
    ],
    "tasks": [
        {
            "id": 20,
            "type": "delivery",
            "pickup": {"label": "hub", "lat": 6.51, "lon": 3.38},
            "dropoff": {"label": "customer", "lat": 6.55, "lon": 3.36},
            "weight_kg": 4.5,
            "collection_amount": 150000,
            "release": 30,
            "strategy": "nearest"
        },
        {
            "id": 10,
            "type": "survey",
            "dropoff": {"lat": 6.49, "lon": 3.41},
            "release": 30
        },
        {
            "id": 5,
            "type": "collection",
            "dropoff": {"lat": 6.49, "lon": 3.41},
            "release": 60
        }
    ]
})";

std::string error_of(const std::string& json) {
    try {
        (void)load_scenario_from_string(json);
    } catch (const LoaderError& e) {
        return e.what();
    }
    return {};
}

} // anonymous namespace

TEST(ScenarioLoaderTest, ParsesWorkers) {
    auto scenario = load_scenario_from_string(FULL_SCENARIO);

    ASSERT_EQ(scenario.workers.size(), 2U);
    const auto& rider = scenario.workers[0];
    EXPECT_EQ(rider.profile.id, 1U);
    EXPECT_EQ(rider.profile.type, core::WorkerType::Rider);
    EXPECT_EQ(rider.profile.status, core::WorkerStatus::Active);
    EXPECT_EQ(rider.profile.verification_status, core::VerificationStatus::Approved);
    EXPECT_DOUBLE_EQ(rider.profile.rating, 4.6);
    EXPECT_EQ(rider.profile.completed_tasks, 120U);
    ASSERT_TRUE(rider.profile.vehicle.has_value());
    EXPECT_EQ(rider.profile.vehicle->type, "motorcycle");
    EXPECT_DOUBLE_EQ(rider.profile.vehicle->capacity_kg, 20.0);
    ASSERT_EQ(rider.profile.preferences.preferred_types.size(), 2U);
    EXPECT_TRUE(rider.profile.preferences.accept_cod);
    EXPECT_EQ(rider.location, (core::GeoPoint{6.52, 3.37}));
    EXPECT_EQ(rider.availability, core::WorkerAvailability::Online);
    EXPECT_EQ(rider.response, WorkerResponse::Decline);
    EXPECT_EQ(rider.response_delay, core::duration_from_seconds(8.0));
    EXPECT_EQ(rider.decline_reason, "too far");

    const auto& surveyor = scenario.workers[1];
    EXPECT_EQ(surveyor.profile.status, core::WorkerStatus::Suspended);
    EXPECT_EQ(surveyor.profile.verification_status, core::VerificationStatus::Pending);
    EXPECT_DOUBLE_EQ(surveyor.profile.rating, 5.0);
    EXPECT_FALSE(surveyor.profile.vehicle.has_value());
    EXPECT_EQ(surveyor.availability, core::WorkerAvailability::Busy);
    EXPECT_EQ(surveyor.response, WorkerResponse::Accept);
    EXPECT_EQ(surveyor.response_delay, core::duration_from_seconds(5.0));
}

TEST(ScenarioLoaderTest, ParsesTasksSortedByRelease) {
    auto scenario = load_scenario_from_string(FULL_SCENARIO);

    ASSERT_EQ(scenario.tasks.size(), 3U);
    EXPECT_EQ(scenario.tasks[0].task.id, 10U);
    EXPECT_EQ(scenario.tasks[1].task.id, 20U);
    EXPECT_EQ(scenario.tasks[2].task.id, 5U);

    const auto& delivery = scenario.tasks[1];
    EXPECT_EQ(delivery.task.type, core::TaskType::Delivery);
    EXPECT_EQ(delivery.task.status, core::TaskStatus::Pending);
    ASSERT_TRUE(delivery.task.pickup.has_value());
    EXPECT_EQ(delivery.task.pickup->label, "hub");
    EXPECT_EQ(delivery.task.effective_location(), (core::GeoPoint{6.51, 3.38}));
    EXPECT_DOUBLE_EQ(delivery.task.total_weight_kg, 4.5);
    EXPECT_EQ(delivery.task.collection_amount.minor, 150000);
    EXPECT_EQ(delivery.release, core::time_from_seconds(30.0));
    EXPECT_EQ(delivery.strategy, algo::Strategy::Nearest);

    const auto& survey = scenario.tasks[0];
    EXPECT_FALSE(survey.task.pickup.has_value());
    EXPECT_FALSE(survey.strategy.has_value());
}

TEST(ScenarioLoaderTest, EmptyScenario) {
    auto scenario = load_scenario_from_string("{}");
    EXPECT_TRUE(scenario.workers.empty());
    EXPECT_TRUE(scenario.tasks.empty());
}

TEST(ScenarioLoaderTest, ReportsBadInput) {
    EXPECT_EQ(error_of(R"({"workers": [{"id": 1, "type": "pilot", "location": {"lat": 0, "lon": 0}}]})"),
              "workers[0]: unknown type 'pilot'");
    EXPECT_EQ(error_of(R"({"workers": [{"id": 1, "type": "rider"}]})"),
              "workers[0]: missing required field 'location'");
    EXPECT_EQ(error_of(R"({"workers": [{"id": 1, "type": "rider", "location": {"lat": 91, "lon": 0}}]})"),
              "workers[0].location: coordinates out of range");
    EXPECT_EQ(error_of(R"({"workers": [{"id": 1, "type": "rider", "acceptance_rate": 1.5,
                           "location": {"lat": 0, "lon": 0}}]})"),
              "workers[0]: field 'acceptance_rate' must be within [0, 1]");
    EXPECT_EQ(error_of(R"({"tasks": [{"id": 1, "type": "delivery"}]})"),
              "tasks[0]: missing required field 'dropoff'");
    EXPECT_EQ(error_of(R"({"tasks": [{"id": 1, "type": "delivery", "strategy": "lottery",
                           "dropoff": {"lat": 0, "lon": 0}}]})"),
              "tasks[0]: unknown strategy 'lottery'");
    EXPECT_EQ(error_of("[]"), "scenario: root must be an object");
}

TEST(ScenarioLoaderTest, DuplicateIdsRejected) {
    EXPECT_EQ(error_of(R"({"tasks": [
                  {"id": 1, "type": "survey", "dropoff": {"lat": 0, "lon": 0}},
                  {"id": 1, "type": "survey", "dropoff": {"lat": 0, "lon": 0}}]})"),
              "tasks[1]: duplicate task id 1");
    EXPECT_EQ(error_of(R"({"workers": [
                  {"id": 4, "type": "rider", "location": {"lat": 0, "lon": 0}},
                  {"id": 4, "type": "walker", "location": {"lat": 0, "lon": 0}}]})"),
              "workers[1]: duplicate worker id 4");
}

TEST(ScenarioLoaderTest, MissingFileThrows) {
    EXPECT_THROW((void)load_scenario("/nonexistent/scenario.json"), LoaderError);
}

TEST(WorkerResponseTest, Names) {
    EXPECT_EQ(to_string(WorkerResponse::Ignore), "ignore");
    EXPECT_EQ(parse_worker_response("decline"), WorkerResponse::Decline);
    EXPECT_FALSE(parse_worker_response("maybe").has_value());
}

#include <gigdispatch/store/earning_calculator.hpp>

#include <gtest/gtest.h>

using namespace gigdispatch;

class FlatRateEarningTest : public ::testing::Test {
protected:
    core::CallContext ctx;
    core::GigWorker worker;
    core::Task task;
};

TEST_F(FlatRateEarningTest, DefaultTariffComponents) {
    store::FlatRateEarningCalculator calc;
    task.total_weight_kg = 4.0;

    auto earning = calc.compute(ctx, task, worker, 2.0);

    EXPECT_EQ(earning.base.minor, 500);
    EXPECT_EQ(earning.distance.minor, 200);
    EXPECT_EQ(earning.weight.minor, 40);
    EXPECT_EQ(earning.time.minor, 30);  // 2 km * 3 min/km * 5
    EXPECT_EQ(earning.bonus.minor, 0);
    EXPECT_EQ(earning.total.minor, 770);
}

TEST_F(FlatRateEarningTest, SurgeAppliesBeforeBonus) {
    store::FlatRateEarningCalculator calc(store::FlatRateTariff{
        .base = core::Money{1000},
        .per_km = core::Money{0},
        .per_kg = core::Money{0},
        .per_minute = core::Money{0},
        .surge_multiplier = 1.5,
        .cod_bonus = core::Money{300},
    });
    task.collection_amount = core::Money{25'000};

    auto earning = calc.compute(ctx, task, worker, 5.0);

    EXPECT_DOUBLE_EQ(earning.surge_multiplier, 1.5);
    EXPECT_EQ(earning.bonus.minor, 300);
    EXPECT_EQ(earning.total.minor, 1800);
}

TEST_F(FlatRateEarningTest, NoBonusWithoutCollection) {
    store::FlatRateEarningCalculator calc;
    task.collection_amount = core::Money{0};

    EXPECT_EQ(calc.compute(ctx, task, worker, 0.0).bonus.minor, 0);
    EXPECT_EQ(calc.compute(ctx, task, worker, 0.0).total.minor, 500);
}

#include <gigdispatch/store/earning_calculator.hpp>

#include <cmath>

namespace gigdispatch::store {

namespace {

core::Money scale(core::Money rate, double quantity) noexcept {
    return core::Money{static_cast<int64_t>(std::llround(static_cast<double>(rate.minor) * quantity))};
}

} // namespace

FlatRateEarningCalculator::FlatRateEarningCalculator(FlatRateTariff tariff)
    : tariff_(tariff) {}

core::EarningBreakdown FlatRateEarningCalculator::compute(const core::CallContext& /*ctx*/,
                                                          const core::Task& task,
                                                          const core::GigWorker& /*worker*/,
                                                          double distance_km) {
    core::EarningBreakdown earning;
    earning.base = tariff_.base;
    earning.distance = scale(tariff_.per_km, distance_km);
    earning.weight = scale(tariff_.per_kg, task.total_weight_kg);
    earning.time = scale(tariff_.per_minute, distance_km * tariff_.minutes_per_km);
    earning.surge_multiplier = tariff_.surge_multiplier;
    if (task.collection_amount.is_positive()) {
        earning.bonus = tariff_.cod_bonus;
    }

    core::Money subtotal = earning.base + earning.distance + earning.weight + earning.time;
    earning.total = scale(subtotal, earning.surge_multiplier) + earning.bonus;
    return earning;
}

} // namespace gigdispatch::store

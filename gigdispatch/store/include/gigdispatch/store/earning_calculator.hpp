#pragma once

#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/types.hpp>

namespace gigdispatch::store {

/// @brief Rates applied by FlatRateEarningCalculator, in minor units.
/// @ingroup store
struct FlatRateTariff {
    core::Money base{500};          ///< Per task.
    core::Money per_km{100};
    core::Money per_kg{10};
    core::Money per_minute{5};      ///< Applied to the estimated ride time.
    double surge_multiplier{1.0};
    core::Money cod_bonus{200};     ///< Added when the task collects cash.
    double minutes_per_km{3.0};     ///< Time estimate used for the time component.
};

/// @brief Deterministic pricing for simulations and tests.
///
/// total = (base + distance + weight + time) * surge + bonus
///
/// @ingroup store
class FlatRateEarningCalculator : public core::EarningCalculator {
public:
    explicit FlatRateEarningCalculator(FlatRateTariff tariff = {});

    [[nodiscard]] const FlatRateTariff& tariff() const noexcept { return tariff_; }

    core::EarningBreakdown compute(const core::CallContext& ctx, const core::Task& task,
                                   const core::GigWorker& worker, double distance_km) override;

private:
    FlatRateTariff tariff_;
};

} // namespace gigdispatch::store

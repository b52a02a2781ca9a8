#pragma once

#include <gigdispatch/core/collaborators.hpp>

#include <string_view>

namespace gigdispatch::store {

/// @brief Mean Earth radius used for great-circle distances.
inline constexpr double EARTH_RADIUS_KM = 6371.0;

/// @brief Great-circle distance between two points (haversine formula).
[[nodiscard]] double haversine_km(core::GeoPoint from, core::GeoPoint to) noexcept;

/// @brief Average travel speed in km/h for a vehicle type.
///
/// Known types: bicycle, motorcycle, car, van, truck, foot. Anything else
/// travels at the motorcycle speed.
[[nodiscard]] double vehicle_speed_kmh(std::string_view vehicle_type) noexcept;

/// @brief GeoService that works on straight lines and fixed speeds.
///
/// ETA is the great-circle distance at the vehicle's speed, rounded up to
/// whole minutes with a minimum of one. Routes are the direct segment.
///
/// @ingroup store
class HaversineGeoService : public core::GeoService {
public:
    double distance_km(core::GeoPoint from, core::GeoPoint to) override;
    int eta_minutes(const core::CallContext& ctx, core::GeoPoint from, core::GeoPoint to,
                    std::string_view vehicle_type) override;
    core::Route driving_route(const core::CallContext& ctx, core::GeoPoint from,
                              core::GeoPoint to) override;
};

} // namespace gigdispatch::store

#include <gigdispatch/store/geo_service.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <utility>

namespace gigdispatch::store {

namespace {

constexpr double DEFAULT_SPEED_KMH = 30.0;

constexpr std::array<std::pair<std::string_view, double>, 6> VEHICLE_SPEEDS{{
    {"bicycle", 15.0},
    {"motorcycle", 30.0},
    {"car", 35.0},
    {"van", 30.0},
    {"truck", 25.0},
    {"foot", 5.0},
}};

constexpr double to_radians(double degrees) noexcept {
    return degrees * std::numbers::pi / 180.0;
}

} // namespace

double haversine_km(core::GeoPoint from, core::GeoPoint to) noexcept {
    double dlat = to_radians(to.latitude - from.latitude);
    double dlon = to_radians(to.longitude - from.longitude);

    double a = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
               std::cos(to_radians(from.latitude)) * std::cos(to_radians(to.latitude)) *
                   std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return EARTH_RADIUS_KM * c;
}

double vehicle_speed_kmh(std::string_view vehicle_type) noexcept {
    for (const auto& [name, speed] : VEHICLE_SPEEDS) {
        if (name == vehicle_type) {
            return speed;
        }
    }
    return DEFAULT_SPEED_KMH;
}

double HaversineGeoService::distance_km(core::GeoPoint from, core::GeoPoint to) {
    return haversine_km(from, to);
}

int HaversineGeoService::eta_minutes(const core::CallContext& /*ctx*/, core::GeoPoint from,
                                     core::GeoPoint to, std::string_view vehicle_type) {
    double hours = haversine_km(from, to) / vehicle_speed_kmh(vehicle_type);
    return std::max(1, static_cast<int>(std::ceil(hours * 60.0)));
}

core::Route HaversineGeoService::driving_route(const core::CallContext& /*ctx*/, core::GeoPoint from,
                                               core::GeoPoint to) {
    return core::Route{.path = {from, to}, .distance_km = haversine_km(from, to)};
}

} // namespace gigdispatch::store

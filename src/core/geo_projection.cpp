/**
 * @file geo_projection.cpp
 * @brief Реализация локальной плоской аппроксимации
 */

#include "geo_projection.hpp"
#include <cmath>
#include <numbers>

namespace drilltrace::core {

namespace {

constexpr double kMinMetersPerDegree = 1e-6;

} // namespace

double metersPerDegreeLongitude(double latitude) noexcept {
    return kMetersPerDegreeLongitudeAtEquator * std::cos(latitude * std::numbers::pi / 180.0);
}

glm::dvec2 geographicToLocal(const GeoPoint& origin, const GeoPoint& point) noexcept {
    return {
        (point.longitude - origin.longitude) * metersPerDegreeLongitude(origin.latitude),
        (point.latitude - origin.latitude) * kMetersPerDegreeLatitude
    };
}

GeoPoint localToGeographic(const GeoPoint& origin, const glm::dvec2& offset) noexcept {
    GeoPoint result;
    result.latitude = origin.latitude + offset.y / kMetersPerDegreeLatitude;

    double scale = metersPerDegreeLongitude(origin.latitude);
    result.longitude = std::abs(scale) > kMinMetersPerDegree
        ? origin.longitude + offset.x / scale
        : origin.longitude;
    return result;
}

bool isGeographicCollar(const Collar& collar) noexcept {
    bool has_xy = collar.easting.has_value() && collar.northing.has_value();
    bool has_latlon = collar.latitude.has_value() && collar.longitude.has_value();
    return !has_xy && has_latlon;
}

void projectGeographicCollars(CollarList& collars) {
    const Collar* reference = nullptr;
    for (const auto& collar : collars) {
        if (isGeographicCollar(collar)) {
            reference = &collar;
            break;
        }
    }
    if (reference == nullptr) {
        return;
    }

    GeoPoint origin{*reference->latitude, *reference->longitude};
    for (auto& collar : collars) {
        if (!isGeographicCollar(collar)) {
            continue;
        }
        auto local = geographicToLocal(origin, {*collar.latitude, *collar.longitude});
        collar.position.x = local.x;
        collar.position.y = local.y;
    }
}

} // namespace drilltrace::core

#include <doctest/doctest.h>
#include "core/geo_projection.hpp"

using namespace drilltrace::core;
using namespace drilltrace::model;

namespace {

Collar geoCollar(const std::string& hole_id, double latitude, double longitude) {
    Collar collar;
    collar.hole_id = hole_id;
    collar.latitude = latitude;
    collar.longitude = longitude;
    return collar;
}

} // namespace

TEST_CASE("Масштаб градуса долготы") {
    CHECK(metersPerDegreeLongitude(0.0) == doctest::Approx(111320.0));
    CHECK(metersPerDegreeLongitude(60.0) == doctest::Approx(55660.0));
    CHECK(metersPerDegreeLongitude(-60.0) == doctest::Approx(55660.0));
}

TEST_CASE("Смещение от начала отсчёта в метрах") {
    GeoPoint origin{-30.0, 120.0};
    auto local = geographicToLocal(origin, {-29.99, 120.01});
    CHECK(local.x == doctest::Approx(0.01 * metersPerDegreeLongitude(-30.0)));
    CHECK(local.y == doctest::Approx(0.01 * kMetersPerDegreeLatitude));

    auto back = localToGeographic(origin, local);
    CHECK(back.latitude == doctest::Approx(-29.99));
    CHECK(back.longitude == doctest::Approx(120.01));
}

TEST_CASE("У полюса долгота не меняется") {
    GeoPoint pole{90.0, 45.0};
    auto geo = localToGeographic(pole, {100.0, -50.0});
    CHECK(geo.longitude == doctest::Approx(45.0));
    CHECK(geo.latitude == doctest::Approx(90.0 - 50.0 / kMetersPerDegreeLatitude));
}

TEST_CASE("Географические устья размещаются относительно первого") {
    Collar projected;
    projected.hole_id = "P1";
    projected.easting = 1000.0;
    projected.northing = 2000.0;
    projected.latitude = 10.0;
    projected.longitude = 10.0;
    projected.position = {1000.0, 2000.0, 0.0};

    CollarList collars = {projected, geoCollar("G1", -30.0, 120.0), geoCollar("G2", -30.0, 120.001)};
    CHECK_FALSE(isGeographicCollar(collars[0]));
    CHECK(isGeographicCollar(collars[1]));

    projectGeographicCollars(collars);

    CHECK(collars[0].position.x == doctest::Approx(1000.0));
    CHECK(collars[1].position.x == doctest::Approx(0.0));
    CHECK(collars[1].position.y == doctest::Approx(0.0));
    CHECK(collars[2].position.x == doctest::Approx(96.41).epsilon(0.001));
    CHECK(collars[2].position.y == doctest::Approx(0.0));
}

TEST_CASE("Без географических устьев список не меняется") {
    Collar collar;
    collar.hole_id = "P1";
    collar.easting = 5.0;
    collar.northing = 6.0;
    collar.position = {5.0, 6.0, 7.0};
    CollarList collars = {collar};

    projectGeographicCollars(collars);
    CHECK(collars[0].position == (Coordinate3D{5.0, 6.0, 7.0}));
}

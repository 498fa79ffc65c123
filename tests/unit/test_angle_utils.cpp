#include <doctest/doctest.h>
#include "core/angle_utils.hpp"
#include <numbers>

using namespace drilltrace::core;
using namespace drilltrace::model;
using namespace drilltrace::model::literals;

TEST_CASE("inclinationFromDip") {
    CHECK(inclinationFromDip(Degrees{-90.0}).value == doctest::Approx(0.0));
    CHECK(inclinationFromDip(Degrees{-60.0}).value == doctest::Approx(30.0));
    CHECK(inclinationFromDip(Degrees{0.0}).value == doctest::Approx(90.0));

    SUBCASE("Ограничение диапазона") {
        CHECK(inclinationFromDip(Degrees{-120.0}).value == doctest::Approx(0.0));
        CHECK(inclinationFromDip(Degrees{100.0}).value == doctest::Approx(180.0));
    }
}

TEST_CASE("Направляющие косинусы") {
    SUBCASE("Вертикально вниз") {
        auto dc = directionCosines(Degrees{123.0}, Degrees{-90.0});
        CHECK(std::abs(dc.x) < 1e-12);
        CHECK(std::abs(dc.y) < 1e-12);
        CHECK(dc.z == doctest::Approx(1.0));
    }

    SUBCASE("Горизонтально на север") {
        auto dc = directionCosines(Degrees{0.0}, Degrees{0.0});
        CHECK(std::abs(dc.x) < 1e-12);
        CHECK(dc.y == doctest::Approx(1.0));
        CHECK(std::abs(dc.z) < 1e-12);
    }

    SUBCASE("Горизонтально на восток") {
        auto dc = directionCosines(Orientation{Degrees{90.0}, Degrees{0.0}});
        CHECK(dc.x == doctest::Approx(1.0));
        CHECK(std::abs(dc.y) < 1e-12);
    }

    SUBCASE("Единичная длина") {
        auto dc = directionCosines(Degrees{217.0}, Degrees{-33.0});
        CHECK(dc.x * dc.x + dc.y * dc.y + dc.z * dc.z == doctest::Approx(1.0));
    }
}

TEST_CASE("Усреднение и интерполяция ориентации") {
    Orientation a{10.0_deg, -60.0_deg};
    Orientation b{30.0_deg, -80.0_deg};

    auto mean = meanOrientation(a, b);
    CHECK(mean.azimuth.value == doctest::Approx(20.0));
    CHECK(mean.dip.value == doctest::Approx(-70.0));

    CHECK(interpolateOrientation(a, b, 0.0) == a);
    auto quarter = interpolateOrientation(a, b, 0.25);
    CHECK(quarter.azimuth.value == doctest::Approx(15.0));
    CHECK(quarter.dip.value == doctest::Approx(-65.0));

    // Переход через север не учитывается
    auto wrap = meanOrientation(Orientation{350.0_deg, -60.0_deg}, Orientation{10.0_deg, -60.0_deg});
    CHECK(wrap.azimuth.value == doctest::Approx(180.0));
}

TEST_CASE("Линейная интерполяция значения") {
    CHECK(interpolate(5.0, 0.0, 0.0, 10.0, 10.0) == doctest::Approx(5.0));
    CHECK(interpolate(2.5, 100.0, 0.0, 90.0, 10.0) == doctest::Approx(97.5));
    CHECK(interpolate(3.0, 7.0, 3.0, 9.0, 3.0) == doctest::Approx(7.0));
}

TEST_CASE("Единицы измерения") {
    CHECK(Degrees{180.0}.toRadians().value == doctest::Approx(std::numbers::pi));
    CHECK(Radians{std::numbers::pi / 2.0}.toDegrees().value == doctest::Approx(90.0));
    CHECK((10.0_m + 2.5_m).value == doctest::Approx(12.5));
    CHECK(Meters{3.0} < Meters{4.0});
}

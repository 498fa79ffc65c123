/**
 * @file test_trajectory.cpp
 * @brief Unit-тесты для методов расчёта смещения на интервале
 */

#include <doctest/doctest.h>
#include "core/trajectory.hpp"
#include <cmath>
#include <numbers>

using namespace drilltrace::core;
using namespace drilltrace::model;

namespace {

Orientation orient(double azimuth, double dip) {
    return {Degrees{azimuth}, Degrees{dip}};
}

} // namespace

TEST_CASE("Вертикальный участок (dip = -90)") {
    Meters length{100.0};
    auto down = orient(0.0, -90.0);

    SUBCASE("Tangential") {
        auto result = tangential(length, down, down);
        CHECK(result.east == doctest::Approx(0.0));
        CHECK(result.north == doctest::Approx(0.0));
        CHECK(result.down == doctest::Approx(100.0));
    }

    SUBCASE("Balanced Tangential") {
        auto result = balancedTangential(length, down, down);
        CHECK(result.east == doctest::Approx(0.0));
        CHECK(result.north == doctest::Approx(0.0));
        CHECK(result.down == doctest::Approx(100.0));
    }

    SUBCASE("Minimum Curvature") {
        auto result = minimumCurvature(length, down, down);
        CHECK(result.east == doctest::Approx(0.0));
        CHECK(result.north == doctest::Approx(0.0));
        CHECK(result.down == doctest::Approx(100.0));
    }
}

TEST_CASE("Горизонтальный участок на восток") {
    auto east = orient(90.0, 0.0);
    auto result = minimumCurvature(Meters{50.0}, east, east);

    CHECK(result.east == doctest::Approx(50.0));
    CHECK(std::abs(result.north) < 1e-9);
    CHECK(std::abs(result.down) < 1e-9);
}

TEST_CASE("Прямой наклонный участок: минимальная кривизна совпадает с тангенциальным") {
    auto s = orient(45.0, -60.0);

    CHECK(calculateRatioFactor(doglegAngle(s, s)) == doctest::Approx(1.0));

    auto mc = minimumCurvature(Meters{100.0}, s, s);
    auto tg = tangential(Meters{100.0}, s, s);
    CHECK(mc.east == doctest::Approx(tg.east));
    CHECK(mc.north == doctest::Approx(tg.north));
    CHECK(mc.down == doctest::Approx(tg.down));

    // Зенит 30°: горизонтальная составляющая 50, вертикальная 86.6
    double horizontal = std::hypot(tg.east, tg.north);
    CHECK(horizontal == doctest::Approx(50.0));
    CHECK(tg.down == doctest::Approx(86.6025).epsilon(0.0001));
}

TEST_CASE("Поворот на 90°: дуга окружности") {
    auto s0 = orient(0.0, -90.0);
    auto s1 = orient(90.0, 0.0);

    auto dogleg = doglegAngle(s0, s1);
    CHECK(dogleg.value == doctest::Approx(std::numbers::pi / 2.0));

    double rf = calculateRatioFactor(dogleg);
    CHECK(rf == doctest::Approx(4.0 / std::numbers::pi));

    // Радиус дуги R = L / DL, смещение по обеим осям равно R
    auto result = minimumCurvature(Meters{100.0}, s0, s1);
    double radius = 100.0 / (std::numbers::pi / 2.0);
    CHECK(result.east == doctest::Approx(radius));
    CHECK(std::abs(result.north) < 1e-9);
    CHECK(result.down == doctest::Approx(radius));
}

TEST_CASE("Балансный тангенциальный: направление по средним углам") {
    auto result = balancedTangential(Meters{100.0}, orient(0.0, -90.0), orient(90.0, 0.0));

    // Средний азимут 45°, средний dip -45° (зенит 45°)
    CHECK(result.east == doctest::Approx(50.0));
    CHECK(result.north == doctest::Approx(50.0));
    CHECK(result.down == doctest::Approx(70.7107).epsilon(0.0001));
}

TEST_CASE("Тангенциальный метод игнорирует конечную станцию") {
    auto a = tangential(Meters{10.0}, orient(0.0, -60.0), orient(180.0, -10.0));
    auto b = tangential(Meters{10.0}, orient(0.0, -60.0), orient(0.0, -60.0));
    CHECK(a.east == doctest::Approx(b.east));
    CHECK(a.north == doctest::Approx(b.north));
    CHECK(a.down == doctest::Approx(b.down));
}

TEST_CASE("Ratio factor") {
    SUBCASE("Нулевой угол") {
        CHECK(calculateRatioFactor(Radians{0.0}) == doctest::Approx(1.0));
    }

    SUBCASE("Угол на пороге") {
        CHECK(calculateRatioFactor(Radians{1e-7}) == doctest::Approx(1.0));
    }

    SUBCASE("Малый угол") {
        CHECK(calculateRatioFactor(Radians{0.01}) == doctest::Approx(1.0).epsilon(0.001));
    }

    SUBCASE("Большой угол") {
        double rf = calculateRatioFactor(Radians{1.0});
        CHECK(rf > 1.0);
        CHECK(rf == doctest::Approx(2.0 * std::tan(0.5)));
    }
}

TEST_CASE("calculateDisplacement выбирает метод") {
    auto s0 = orient(10.0, -70.0);
    auto s1 = orient(30.0, -50.0);
    Meters length{20.0};

    auto mc = calculateDisplacement(length, s0, s1, DesurveyMethod::MinimumCurvature);
    auto ref = minimumCurvature(length, s0, s1);
    CHECK(mc.east == doctest::Approx(ref.east));
    CHECK(mc.down == doctest::Approx(ref.down));

    auto tg = calculateDisplacement(length, s0, s1, DesurveyMethod::Tangential);
    CHECK(tg.north == doctest::Approx(tangential(length, s0, s1).north));
}

TEST_CASE("Фабрика калькуляторов") {
    SUBCASE("Tangential") {
        auto calc = createCalculator(DesurveyMethod::Tangential);
        CHECK(calc->method() == DesurveyMethod::Tangential);
        auto o = calc->orientationAt(orient(0.0, -60.0), orient(20.0, -70.0), 0.5);
        CHECK(o.azimuth.value == doctest::Approx(0.0));
        CHECK(o.dip.value == doctest::Approx(-60.0));
    }

    SUBCASE("Balanced Tangential") {
        auto calc = createCalculator(DesurveyMethod::BalancedTangential);
        CHECK(calc->method() == DesurveyMethod::BalancedTangential);
        auto o = calc->orientationAt(orient(0.0, -60.0), orient(20.0, -70.0), 0.2);
        CHECK(o.azimuth.value == doctest::Approx(10.0));
        CHECK(o.dip.value == doctest::Approx(-65.0));
    }

    SUBCASE("Minimum Curvature") {
        auto calc = createCalculator(DesurveyMethod::MinimumCurvature);
        CHECK(calc->method() == DesurveyMethod::MinimumCurvature);
        CHECK(!calc->name().empty());
        auto o = calc->orientationAt(orient(0.0, -60.0), orient(20.0, -70.0), 0.25);
        CHECK(o.azimuth.value == doctest::Approx(5.0));
        CHECK(o.dip.value == doctest::Approx(-62.5));
    }
}

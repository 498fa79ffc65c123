#include <doctest/doctest.h>
#include "core/compositing.hpp"
#include "model/data_errors.hpp"

using namespace drilltrace::core;
using namespace drilltrace::model;

namespace {

Interval assay(const std::string& hole_id, double from, double to, double au) {
    Interval interval;
    interval.hole_id = hole_id;
    interval.from = from;
    interval.to = to;
    interval.mid = 0.5 * (from + to);
    interval.extra.set("au", au);
    return interval;
}

TracePoint point(double md, double x, double z) {
    TracePoint p;
    p.hole_id = "H1";
    p.md = md;
    p.position = {x, 0.0, z};
    p.azimuth = md;
    p.dip = -90.0;
    return p;
}

} // namespace

TEST_CASE("Композит по длине перекрытия") {
    IntervalList intervals = {assay("H1", 0.0, 2.0, 1.0), assay("H1", 2.0, 4.0, 3.0)};

    SUBCASE("Один композит на весь диапазон") {
        auto result = compositeIntervals(intervals, "au", Meters{4.0});
        REQUIRE(result.size() == 1);
        CHECK(result[0].from == doctest::Approx(0.0));
        CHECK(result[0].to == doctest::Approx(4.0));
        CHECK(result[0].mid == doctest::Approx(2.0));
        CHECK(result[0].extra.number("au") == doctest::Approx(2.0));
    }

    SUBCASE("Сумма") {
        auto result = compositeIntervals(intervals, "au", Meters{4.0}, CompositeMethod::Sum);
        REQUIRE(result.size() == 1);
        CHECK(result[0].extra.number("au") == doctest::Approx(8.0));
    }

    SUBCASE("Метровые композиты") {
        auto result = compositeIntervals(intervals, "au", Meters{1.0});
        REQUIRE(result.size() == 4);
        CHECK(result[1].extra.number("au") == doctest::Approx(1.0));
        CHECK(result[2].extra.number("au") == doctest::Approx(3.0));
    }
}

TEST_CASE("Частичное перекрытие композита") {
    IntervalList intervals = {assay("H1", 0.0, 3.0, 2.0), assay("H1", 3.0, 4.0, 6.0)};
    auto result = compositeIntervals(intervals, "au", Meters{2.0});
    REQUIRE(result.size() == 2);
    CHECK(result[0].extra.number("au") == doctest::Approx(2.0));
    CHECK(result[1].extra.number("au") == doctest::Approx(4.0));
}

TEST_CASE("Пропуск отрезков без данных") {
    IntervalList intervals = {assay("H1", 0.0, 1.0, 5.0), assay("H1", 3.0, 4.0, 7.0)};
    auto result = compositeIntervals(intervals, "au", Meters{1.0});
    REQUIRE(result.size() == 2);
    CHECK(result[0].from == doctest::Approx(0.0));
    CHECK(result[1].from == doctest::Approx(3.0));
}

TEST_CASE("Скважины композитируются раздельно") {
    IntervalList intervals = {assay("H1", 0.0, 2.0, 1.0), assay("H2", 10.0, 12.0, 9.0)};
    auto result = compositeIntervals(intervals, "au", Meters{2.0});
    REQUIRE(result.size() == 2);
    CHECK(result[0].hole_id == "H1");
    CHECK(result[1].hole_id == "H2");
    CHECK(result[1].from == doctest::Approx(10.0));
}

TEST_CASE("Некорректная длина композита") {
    IntervalList intervals = {assay("H1", 0.0, 2.0, 1.0)};
    CHECK_THROWS_AS((void)compositeIntervals(intervals, "au", Meters{0.0}), InvalidValueError);
    CHECK_THROWS_AS((void)compositeIntervals(intervals, "au", Meters{-1.0}), InvalidValueError);
}

TEST_CASE("Передискретизация траектории") {
    TraceList points = {point(0.0, 0.0, 100.0), point(10.0, 10.0, 90.0), point(20.0, 10.0, 80.0)};

    auto result = resampleTrace(points, Meters{2.5});
    REQUIRE(result.size() == 9);
    CHECK(result[2].md == doctest::Approx(5.0));
    CHECK(result[2].position.x == doctest::Approx(5.0));
    CHECK(result[2].position.z == doctest::Approx(95.0));
    CHECK(result[6].md == doctest::Approx(15.0));
    CHECK(result[6].position.x == doctest::Approx(10.0));
    CHECK(result[6].azimuth == doctest::Approx(15.0));
    CHECK(result.back().md == doctest::Approx(20.0));

    CHECK_THROWS_AS((void)resampleTrace(points, Meters{0.0}), InvalidValueError);
}

TEST_CASE("Передискретизация одной точки") {
    auto result = resampleTrace({point(3.0, 1.0, 2.0)}, Meters{1.0});
    REQUIRE(result.size() == 1);
    CHECK(result[0].md == doctest::Approx(3.0));
}

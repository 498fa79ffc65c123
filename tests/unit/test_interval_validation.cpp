/**
 * @file test_interval_validation.cpp
 * @brief Unit-тесты проверок интервалов и инклинометрии
 */

#include <doctest/doctest.h>
#include "core/interval_validation.hpp"
#include "model/data_errors.hpp"

using namespace drilltrace::core;
using namespace drilltrace::model;

namespace {

Interval makeInterval(const std::string& hole_id, double from, double to) {
    Interval interval;
    interval.hole_id = hole_id;
    interval.from = from;
    interval.to = to;
    interval.mid = 0.5 * (from + to);
    return interval;
}

} // namespace

TEST_CASE("Перекрытие геологических интервалов") {
    SUBCASE("Перекрытие отклоняется") {
        IntervalList geology = {makeInterval("H1", 0.0, 10.0), makeInterval("H1", 9.5, 20.0)};
        try {
            validateNoOverlappingIntervals(geology, "Geology");
            FAIL("ожидалось OverlapError");
        } catch (const OverlapError& e) {
            CHECK(e.operation() == "Geology");
            CHECK(e.holeId() == "H1");
            CHECK(e.from() == doctest::Approx(9.5));
            CHECK(e.previousTo() == doctest::Approx(10.0));
        }
    }

    SUBCASE("Соприкасающиеся интервалы допустимы") {
        IntervalList geology = {makeInterval("H1", 0.0, 10.0), makeInterval("H1", 10.0, 20.0)};
        CHECK_NOTHROW(validateNoOverlappingIntervals(geology, "Geology"));
    }

    SUBCASE("Разные скважины не сравниваются") {
        IntervalList geology = {makeInterval("H1", 0.0, 10.0), makeInterval("H2", 5.0, 20.0)};
        CHECK_NOTHROW(validateNoOverlappingIntervals(geology, "Geology"));
    }

    SUBCASE("Порядок входных данных не важен") {
        IntervalList geology = {
            makeInterval("H1", 9.0, 20.0),
            makeInterval("H2", 0.0, 1.0),
            makeInterval("H1", 0.0, 10.0),
        };
        CHECK_THROWS_AS(validateNoOverlappingIntervals(geology, "Geology"), OverlapError);
    }
}

TEST_CASE("Отчёт по интервалам") {
    Table rows = {
        Row{{"hole_id", "H1"}, {"from", 0.0}, {"to", 10.0}},
        Row{{"hole_id", "H1"}, {"from", 5.0}, {"to", 12.0}},
        Row{{"hole_id", "H1"}, {"from", 20.0}, {"to", 15.0}},
        Row{{"hole_id", "H1"}, {"from", 30.0}},
        Row{{"hole_id", "H2"}, {"from", 0.0}, {"to", 4.0}},
    };

    auto report = validateIntervals(rows);
    CHECK_FALSE(report.is_valid);
    CHECK(report.count(ValidationErrorType::Overlap) == 1);
    CHECK(report.count(ValidationErrorType::NonPositiveLength) == 1);
    CHECK(report.count(ValidationErrorType::MissingDepth) == 1);

    for (const auto& err : report.errors) {
        CHECK(err.hole_id == "H1");
        REQUIRE(err.row_index.has_value());
    }
    CHECK(report.errors.front().toString().find("строка") != std::string::npos);
}

TEST_CASE("Корректные интервалы проходят проверку") {
    Table rows = {
        Row{{"hole_id", "H1"}, {"from", 10.0}, {"to", 20.0}},
        Row{{"hole_id", "H1"}, {"from", 0.0}, {"to", 10.0}},
    };
    auto report = validateIntervals(rows);
    CHECK(report.is_valid);
    CHECK_FALSE(report.hasErrors());
}

TEST_CASE("Отчёт по инклинометрии") {
    Table rows = {
        Row{{"hole_id", "H1"}, {"from", 0.0}},
        Row{{"hole_id", "H1"}, {"from", 50.0}},
        Row{{"hole_id", "H1"}, {"from", 30.0}},
        Row{{"hole_id", "H2"}, {"from", 0.0}},
        Row{{"hole_id", "H2"}, {"from", "n/a"}},
        Row{{"hole_id", "H2"}, {"from", 10.0}},
    };

    auto report = validateSurveys(rows);
    CHECK(report.count(ValidationErrorType::NonMonotonicDepth) == 1);
    CHECK(report.count(ValidationErrorType::MissingDepth) == 1);

    const auto& err = report.errors.front();
    CHECK(err.type == ValidationErrorType::NonMonotonicDepth);
    CHECK(err.row_index == 2u);
}

TEST_CASE("Диапазоны структурных углов") {
    auto measurement = [](double dip, double azimuth) {
        Interval m = makeInterval("H1", 10.0, 10.0);
        m.extra.set("dip", dip);
        m.extra.set("azimuth", azimuth);
        return m;
    };

    SUBCASE("Допустимые значения") {
        IntervalList ok = {measurement(0.0, 0.0), measurement(90.0, 359.9)};
        CHECK(validateStructuralMeasurements(ok).is_valid);
    }

    SUBCASE("Падение больше 90") {
        auto report = validateStructuralMeasurements({measurement(91.0, 10.0)});
        CHECK(report.count(ValidationErrorType::OutOfRange) == 1);
        CHECK(report.errors.front().field == "dip");
    }

    SUBCASE("Азимут 360 и больше") {
        auto report = validateStructuralMeasurements({measurement(45.0, 361.0), measurement(45.0, 360.0)});
        CHECK(report.count(ValidationErrorType::OutOfRange) == 2);
        CHECK(report.errors.back().row_index == 1u);
    }

    SUBCASE("Без углов проверять нечего") {
        CHECK(validateStructuralMeasurements({makeInterval("H1", 1.0, 1.0)}).is_valid);
    }
}

TEST_CASE("Отсутствующие обязательные колонки") {
    Table rows = {Row{{"hole_id", "H1"}, {"from", 0.0}}};
    auto missing = reportMissingColumns(rows, {"hole_id", "from", "to", "azimuth"});
    CHECK(missing == (std::vector<std::string>{"to", "azimuth"}));
}

#include <doctest/doctest.h>
#include "core/hole_key.hpp"

using namespace drilltrace::core;
using namespace drilltrace::model;

TEST_CASE("Нормализация значения идентификатора") {
    CHECK(normalizeHoleIdValue(CellValue{std::string(" H1 ")}) == "H1");
    CHECK(normalizeHoleIdValue(CellValue{10.0}) == "10");
    CHECK(normalizeHoleIdValue(CellValue{}).empty());
    CHECK(normalizeHoleIdValue(CellValue{std::string("  ")}).empty());
}

TEST_CASE("Список кандидатов") {
    CHECK(holeIdCandidates() ==
          (std::vector<std::string>{"hole_id", "holeId", "id", "primary_id"}));
    CHECK(holeIdCandidates(std::string("collar_id")) ==
          (std::vector<std::string>{"collar_id", "hole_id", "holeId", "id", "primary_id"}));
    CHECK(holeIdCandidates(std::string("id")).size() == 4);
}

TEST_CASE("Канонизация строк") {
    Table rows = {
        Row{{"id", "A"}},
        Row{{"id", 7.0}},
    };

    auto result = canonicalizeHoleIdRows(rows);
    CHECK(result.alias_column == "id");
    REQUIRE(result.items.size() == 2);
    CHECK(result.items[0].text("hole_id") == "A");
    CHECK(result.items[1].text("hole_id") == "7");

    SUBCASE("Повторное применение не меняет значения") {
        auto again = canonicalizeHoleIdRows(result.items);
        CHECK(again.alias_column == "hole_id");
        CHECK(again.items == result.items);
    }

    SUBCASE("Повторное применение с той же колонкой") {
        auto again = canonicalizeHoleIdRows(result.items, std::string("id"));
        CHECK(again.items == result.items);
    }
}

TEST_CASE("Колонка выбирается один раз на весь набор") {
    Table rows = {
        Row{{"collar_id", ""}, {"hole_id", "H1"}},
        Row{{"collar_id", "C2"}, {"hole_id", "H2"}},
    };

    auto result = canonicalizeHoleIdRows(rows, std::string("collar_id"));
    CHECK(result.alias_column == "collar_id");
    CHECK(result.items[0].text("hole_id").empty());
    CHECK(result.items[1].text("hole_id") == "C2");
}

TEST_CASE("Пустая предпочтительная колонка уступает следующему кандидату") {
    Table rows = {
        Row{{"collar_id", ""}, {"holeId", "X1"}},
    };
    auto result = canonicalizeHoleIdRows(rows, std::string("collar_id"));
    CHECK(result.alias_column == "holeId");
    CHECK(result.items[0].text("hole_id") == "X1");
}

TEST_CASE("Ошибка при отсутствии идентификатора") {
    Table rows = {Row{{"name", "x"}}};
    try {
        (void)canonicalizeHoleIdRows(rows, std::string("bhid"));
        FAIL("ожидалось исключение");
    } catch (const HoleIdResolutionError& e) {
        CHECK(e.candidates().front() == "bhid");
        CHECK(std::string(e.what()).find("hole_id") != std::string::npos);
    }
}

TEST_CASE("Пустой набор разрешается без ошибки") {
    CHECK(resolveHoleIdColumn(Table{}, std::string("collar_id")) == "collar_id");
    CHECK(resolveHoleIdColumn(Table{}) == "hole_id");
    CHECK(canonicalizeHoleIdRows(Table{}).items.empty());
}

TEST_CASE("Канонизация записей") {
    Interval a;
    a.extra.set("collar_id", "C1");
    Interval b;
    b.hole_id = "ignored";
    b.extra.set("collar_id", 12.0);

    auto result = canonicalizeHoleIds(IntervalList{a, b}, std::string("collar_id"));
    CHECK(result.items[0].hole_id == "C1");
    CHECK(result.items[1].hole_id == "12");
}

TEST_CASE("Первичный ключ скважины") {
    SUBCASE("Имя вида ключа") {
        CHECK(parsePrimaryKeyKind("Company Hole ID") == PrimaryKeyKind::CompanyHoleId);
        CHECK(parsePrimaryKeyKind("collar_id") == PrimaryKeyKind::CollarId);
        CHECK(parsePrimaryKeyKind("custom") == PrimaryKeyKind::Custom);
        CHECK_FALSE(parsePrimaryKeyKind("uuid").has_value());
        CHECK(toString(PrimaryKeyKind::Anumber) == "anumber");
    }

    SUBCASE("Колонка из настройки") {
        CHECK(primaryFieldFromConfig({}) == "companyholeid");
        CHECK(primaryFieldFromConfig({PrimaryKeyKind::Custom, "Lab Id"}) == "lab_id");
        CHECK(primaryFieldFromConfig({PrimaryKeyKind::Custom, ""}) == "companyholeid");
        CHECK(primaryFieldFromConfig({PrimaryKeyKind::CollarId, ""}) == "collarid");
    }

    SUBCASE("Значение по умолчанию из CompanyHoleId") {
        Row row{{"CompanyHoleId", "C-1"}, {"hole_id", "H1"}};
        CHECK(resolvePrimaryId(row, "companyholeid") == "C-1");
    }

    SUBCASE("Пользовательская колонка") {
        Row row{{"Lab Id", "L9"}, {"hole_id", "H1"}};
        CHECK(resolvePrimaryId(row, "lab_id") == "L9");
    }

    SUBCASE("Откат к стандартным колонкам") {
        Row row{{"hole_id", "H1"}};
        CHECK(resolvePrimaryId(row, "anumber") == "H1");
        CHECK(resolvePrimaryId(Row{{"note", "x"}}, "anumber").empty());
    }

    SUBCASE("Запись primary_id в таблицу") {
        Table rows = {
            Row{{"anumber", 101.0}, {"hole_id", "H1"}},
            Row{{"hole_id", "H2"}},
        };
        auto result = assignPrimaryIds(rows, {PrimaryKeyKind::Anumber, ""});
        CHECK(result[0].text("primary_id") == "101");
        CHECK(result[1].text("primary_id") == "H2");
    }
}

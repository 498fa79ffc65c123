#include <doctest/doctest.h>
#include "io/config_io.hpp"
#include "io/file_utils.hpp"
#include "model/data_errors.hpp"
#include <filesystem>

using namespace drilltrace::io;
using namespace drilltrace::model;

TEST_CASE("Разбор полной конфигурации") {
    auto config = configFromJson(R"({
        "desurvey": {"step": 5, "method": "balanced_tangential", "hole_id_column": "collar_id"},
        "column_map": {"CompanyHoleId": "hole_id", "Lab Au": "au_ppm"},
        "primary_key": {"kind": "custom", "custom_key": "LabId"},
        "project_id": "P1"
    })");

    CHECK(config.desurvey.step == doctest::Approx(5.0));
    CHECK(config.desurvey.method == DesurveyMethod::BalancedTangential);
    CHECK(config.desurvey.hole_id_column == std::string("collar_id"));
    CHECK(config.column_map.at("Lab Au") == "au_ppm");
    REQUIRE(config.primary_key.has_value());
    CHECK(config.primary_key->kind == drilltrace::core::PrimaryKeyKind::Custom);
    CHECK(config.primary_key->custom_key == "LabId");
    CHECK(config.project_id == std::string("P1"));
}

TEST_CASE("Пустая конфигурация даёт значения по умолчанию") {
    auto config = configFromJson("{}");
    CHECK(config.desurvey.step == doctest::Approx(1.0));
    CHECK(config.desurvey.method == DesurveyMethod::MinimumCurvature);
    CHECK_FALSE(config.desurvey.hole_id_column.has_value());
    CHECK(config.column_map.empty());
    CHECK_FALSE(config.primary_key.has_value());
    CHECK_FALSE(config.project_id.has_value());
}

TEST_CASE("Некорректные значения отклоняются") {
    CHECK_THROWS_AS((void)configFromJson(R"({"desurvey": {"step": 0}})"), InvalidValueError);
    CHECK_THROWS_AS((void)configFromJson(R"({"desurvey": {"step": "ten"}})"), InvalidValueError);
    CHECK_THROWS_AS((void)configFromJson(R"({"desurvey": {"method": "spline"}})"), InvalidValueError);
    CHECK_THROWS_AS((void)configFromJson(R"({"column_map": {"a": 1}})"), InvalidValueError);
    CHECK_THROWS_AS((void)configFromJson(R"({"primary_key": {"kind": "uuid"}})"), InvalidValueError);
    CHECK_THROWS_AS((void)configFromJson("[]"), InvalidValueError);
}

TEST_CASE("Синтаксическая ошибка получает контекст") {
    try {
        (void)configFromJson("{\"desurvey\": ");
        FAIL("ожидалось ContextWrappedError");
    } catch (const ContextWrappedError& e) {
        CHECK(e.operation() == "loadConfig");
    }
}

TEST_CASE("Сохранение и загрузка конфигурации") {
    namespace fs = std::filesystem;

    AppConfig config;
    config.desurvey.step = 2.5;
    config.desurvey.method = DesurveyMethod::Tangential;
    config.column_map["BHID"] = "hole_id";
    config.project_id = "P7";

    auto path = fs::temp_directory_path() / "drilltrace_config_test.json";
    atomicWrite(path, configToJson(config));

    auto loaded = loadConfig(path);
    CHECK(loaded.desurvey.step == doctest::Approx(2.5));
    CHECK(loaded.desurvey.method == DesurveyMethod::Tangential);
    CHECK(loaded.column_map == config.column_map);
    CHECK(loaded.project_id == std::string("P7"));

    std::error_code ec;
    fs::remove(path, ec);

    CHECK_THROWS_AS((void)loadConfig(path), ContextWrappedError);
}

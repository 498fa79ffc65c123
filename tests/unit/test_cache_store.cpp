#include <doctest/doctest.h>
#include "io/cache_store.hpp"
#include <filesystem>

using namespace drilltrace::io;
using namespace drilltrace::model;

namespace {

TraceList sampleTraces() {
    TraceList traces;
    for (int i = 0; i < 3; ++i) {
        TracePoint p;
        p.hole_id = "H1";
        p.md = static_cast<double>(i);
        p.position = {10.0, 20.0, 30.0 - static_cast<double>(i)};
        p.azimuth = 0.0;
        p.dip = -90.0;
        traces.push_back(p);
    }
    return traces;
}

drilltrace::core::DesurveyResult sampleResult() {
    drilltrace::core::DesurveyResult result;
    result.points = sampleTraces();
    result.alias_column = "collar_id";
    result.skipped = {
        {"H9", drilltrace::core::SkipReason::NoCollar},
        {"H3", drilltrace::core::SkipReason::NoValidStations},
    };
    return result;
}

} // namespace

TEST_CASE("Кэш траекторий в памяти") {
    MemoryKeyValueStore store;
    CHECK_FALSE(loadCachedDesurvey(store, kDesurveyCacheKey).has_value());

    REQUIRE(saveCachedDesurvey(store, kDesurveyCacheKey, sampleResult()));
    auto cached = loadCachedDesurvey(store, kDesurveyCacheKey);
    REQUIRE(cached.has_value());
    REQUIRE(cached->points.size() == 3);
    CHECK(cached->points.back().position.z == doctest::Approx(28.0));
    CHECK(cached->points.back().hole_id == "H1");
    CHECK(cached->alias_column == "collar_id");
}

TEST_CASE("Кэш сохраняет пропущенные скважины") {
    MemoryKeyValueStore store;
    REQUIRE(saveCachedDesurvey(store, kDesurveyCacheKey, sampleResult()));

    auto cached = loadCachedDesurvey(store, kDesurveyCacheKey);
    REQUIRE(cached.has_value());
    REQUIRE(cached->skipped.size() == 2);
    CHECK(cached->skipped[0].hole_id == "H9");
    CHECK(cached->skipped[0].reason == drilltrace::core::SkipReason::NoCollar);
    CHECK(cached->skipped[1].hole_id == "H3");
    CHECK(cached->skipped[1].reason == drilltrace::core::SkipReason::NoValidStations);
}

TEST_CASE("Кэш таблиц") {
    MemoryKeyValueStore store;
    Table table = {Row{{"hole_id", "H1"}, {"easting", 1.0}}};
    REQUIRE(saveCachedTable(store, kCollarsCacheKey, table));

    auto cached = loadCachedTable(store, kCollarsCacheKey);
    REQUIRE(cached.has_value());
    CHECK(*cached == table);
    CHECK_FALSE(loadCachedTable(store, kSurveyCacheKey).has_value());
}

TEST_CASE("Повреждённая запись читается как отсутствующая") {
    MemoryKeyValueStore store;

    SUBCASE("Не JSON") {
        store.set(kSurveyCacheKey, "not json");
    }
    SUBCASE("Другая версия") {
        store.set(kSurveyCacheKey, R"({"version": 99, "rows": []})");
    }
    SUBCASE("Строки не массив") {
        store.set(kSurveyCacheKey, R"({"version": 1, "rows": 5, "skipped": []})");
    }
    SUBCASE("Версия строкой") {
        store.set(kSurveyCacheKey, R"({"version": "1", "rows": []})");
    }

    CHECK_FALSE(loadCachedTable(store, kSurveyCacheKey).has_value());
    CHECK_FALSE(loadCachedDesurvey(store, kSurveyCacheKey).has_value());
}

TEST_CASE("Запись траекторий без пропущенных скважин не используется") {
    MemoryKeyValueStore store;

    SUBCASE("Нет списка") {
        store.set(kDesurveyCacheKey, R"({"version": 1, "rows": []})");
    }
    SUBCASE("Неизвестная причина") {
        store.set(kDesurveyCacheKey,
                  R"({"version": 1, "rows": [], "skipped": [{"hole_id": "H1", "reason": "lost"}]})");
    }

    CHECK_FALSE(loadCachedDesurvey(store, kDesurveyCacheKey).has_value());
}

TEST_CASE("Ключ зависит от параметров расчёта") {
    DesurveyConfig a;
    DesurveyConfig b;
    b.step = 5.0;
    DesurveyConfig c;
    c.method = DesurveyMethod::Tangential;

    auto key_a = desurveyCacheKey(a, "abc");
    CHECK(key_a.find(kDesurveyCacheKey) == 0);
    CHECK(key_a != desurveyCacheKey(b, "abc"));
    CHECK(key_a != desurveyCacheKey(c, "abc"));
    CHECK(key_a != desurveyCacheKey(a, "abd"));
    CHECK(key_a == desurveyCacheKey(a, "abc"));
}

TEST_CASE("Файловое хранилище") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / "drilltrace_cache_test";
    std::error_code ec;
    fs::remove_all(dir, ec);

    FileKeyValueStore store(dir);
    auto key = desurveyCacheKey(DesurveyConfig{}, "fp");
    CHECK_FALSE(store.get(key).has_value());

    REQUIRE(saveCachedDesurvey(store, key, sampleResult()));
    auto cached = loadCachedDesurvey(store, key);
    REQUIRE(cached.has_value());
    CHECK(cached->points.size() == 3);
    CHECK(cached->skipped.size() == 2);

    // Имя файла без ':' и других служебных символов
    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        CHECK(entry.path().filename().string().find(':') == std::string::npos);
        ++files;
    }
    CHECK(files == 1);

    FileKeyValueStore other(dir);
    CHECK(other.get(key).has_value());

    fs::remove_all(dir, ec);
}

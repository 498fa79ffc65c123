/**
 * @file config_io.cpp
 * @brief Реализация чтения и записи конфигурации
 */

#include "config_io.hpp"
#include "file_utils.hpp"
#include "model/data_errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>

namespace drilltrace::io {

using json = nlohmann::json;

namespace {

constexpr std::string_view kOp = "loadConfig";

DesurveyConfig desurveyFromJson(const json& j) {
    DesurveyConfig config;
    if (!j.is_object()) {
        throw InvalidValueError(std::string(kOp), "раздел 'desurvey' должен быть объектом");
    }

    if (j.contains("step")) {
        const auto& step = j["step"];
        if (!step.is_number() || !std::isfinite(step.get<double>()) || step.get<double>() <= 0.0) {
            throw InvalidValueError(std::string(kOp), "'desurvey.step' должен быть положительным числом");
        }
        config.step = step.get<double>();
    }

    if (j.contains("method")) {
        auto name = j["method"].is_string() ? j["method"].get<std::string>() : std::string{};
        auto method = parseDesurveyMethod(name);
        if (!method.has_value()) {
            throw InvalidValueError(std::string(kOp), "неизвестный метод '" + name + "'");
        }
        config.method = *method;
    }

    auto column = j.value("hole_id_column", std::string{});
    if (!column.empty()) {
        config.hole_id_column = column;
    }
    return config;
}

core::PrimaryKeyConfig primaryKeyFromJson(const json& j) {
    core::PrimaryKeyConfig config;
    auto kind_name = j.value("kind", std::string("company_hole_id"));
    auto kind = core::parsePrimaryKeyKind(kind_name);
    if (!kind.has_value()) {
        throw InvalidValueError(std::string(kOp), "неизвестный вид ключа '" + kind_name + "'");
    }
    config.kind = *kind;
    config.custom_key = j.value("custom_key", std::string{});
    return config;
}

AppConfig parseConfig(const json& j) {
    if (!j.is_object()) {
        throw InvalidValueError(std::string(kOp), "корень конфигурации должен быть объектом");
    }

    AppConfig config;
    if (j.contains("desurvey")) {
        config.desurvey = desurveyFromJson(j["desurvey"]);
    }

    if (j.contains("column_map")) {
        const auto& map = j["column_map"];
        if (!map.is_object()) {
            throw InvalidValueError(std::string(kOp), "'column_map' должен быть объектом");
        }
        for (const auto& [source, target] : map.items()) {
            if (!target.is_string()) {
                throw InvalidValueError(std::string(kOp),
                    "значение 'column_map." + source + "' должно быть строкой");
            }
            config.column_map[source] = target.get<std::string>();
        }
    }

    if (j.contains("primary_key")) {
        config.primary_key = primaryKeyFromJson(j["primary_key"]);
    }

    auto project = j.value("project_id", std::string{});
    if (!project.empty()) {
        config.project_id = project;
    }
    return config;
}

} // namespace

AppConfig configFromJson(std::string_view text) {
    // Ошибки типов nlohmann::json тоже получают контекст
    return withDataErrorContext(kOp, [text]() { return parseConfig(json::parse(text)); });
}

AppConfig loadConfig(const std::filesystem::path& path) {
    auto text = withDataErrorContext(kOp, [&path]() { return readTextFile(path); });
    return configFromJson(text);
}

std::string configToJson(const AppConfig& config) {
    json j;
    j["desurvey"]["step"] = config.desurvey.step;
    j["desurvey"]["method"] = toString(config.desurvey.method);
    if (config.desurvey.hole_id_column) {
        j["desurvey"]["hole_id_column"] = *config.desurvey.hole_id_column;
    }

    j["column_map"] = json::object();
    for (const auto& [source, target] : config.column_map) {
        j["column_map"][source] = target;
    }

    if (config.primary_key) {
        j["primary_key"]["kind"] = core::toString(config.primary_key->kind);
        j["primary_key"]["custom_key"] = config.primary_key->custom_key;
    }
    if (config.project_id) {
        j["project_id"] = *config.project_id;
    }
    return j.dump(2);
}

} // namespace drilltrace::io

/**
 * @file config_io.hpp
 * @brief Конфигурация обработки в формате JSON
 *
 * Пример:
 * @code
 * {
 *   "desurvey": { "step": 5, "method": "minimum_curvature", "hole_id_column": "collar_id" },
 *   "column_map": { "CompanyHoleId": "hole_id" },
 *   "primary_key": { "kind": "custom", "custom_key": "LabId" },
 *   "project_id": "P1"
 * }
 * @endcode
 * Все разделы необязательны.
 */

#pragma once

#include "core/column_standardizer.hpp"
#include "core/hole_key.hpp"
#include "model/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace drilltrace::io {

using namespace drilltrace::model;

/**
 * @brief Конфигурация приложения
 */
struct AppConfig {
    DesurveyConfig desurvey;
    core::ColumnOverrides column_map;
    std::optional<core::PrimaryKeyConfig> primary_key;
    std::optional<std::string> project_id;  ///< Фильтр по проекту
};

/**
 * @brief Разбор конфигурации из текста JSON
 *
 * @throws InvalidValueError при неизвестном методе или шаге <= 0
 * @throws ContextWrappedError при синтаксической ошибке JSON
 */
[[nodiscard]] AppConfig configFromJson(std::string_view text);

/**
 * @brief Загрузка конфигурации из файла
 */
[[nodiscard]] AppConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Сериализация конфигурации
 */
[[nodiscard]] std::string configToJson(const AppConfig& config);

} // namespace drilltrace::io

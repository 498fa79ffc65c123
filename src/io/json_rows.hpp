/**
 * @file json_rows.hpp
 * @brief Обмен табличными данными и результатами в формате JSON
 *
 * Таблица — массив объектов ("колонка": значение) либо объект с полем
 * "rows". Порядок колонок сохраняется в порядке ключей документа.
 */

#pragma once

#include "model/records.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace drilltrace::io {

using namespace drilltrace::model;

/**
 * @brief Значение ячейки из JSON
 *
 * null → пусто, число → double, строка → текст, bool → "true"/"false",
 * объекты и массивы сохраняются сериализованным текстом.
 */
[[nodiscard]] CellValue cellFromJson(const nlohmann::ordered_json& j);
[[nodiscard]] nlohmann::ordered_json cellToJson(const CellValue& value);

[[nodiscard]] Row rowFromJson(const nlohmann::ordered_json& j);
[[nodiscard]] nlohmann::ordered_json rowToJson(const Row& row);

/**
 * @brief Таблица из JSON-документа
 * @throws InvalidValueError если документ не массив объектов
 */
[[nodiscard]] Table tableFromJson(const nlohmann::ordered_json& j);
[[nodiscard]] nlohmann::ordered_json tableToJson(const Table& table);

/**
 * @brief Чтение таблицы из файла
 * @throws ContextWrappedError при ошибке чтения или разбора
 */
[[nodiscard]] Table readTableJson(const std::filesystem::path& path);

[[nodiscard]] nlohmann::ordered_json tracesToJson(const TraceList& traces);
[[nodiscard]] TraceList tracesFromJson(const nlohmann::ordered_json& j);
[[nodiscard]] nlohmann::ordered_json intervalsToJson(const IntervalList& intervals);

/**
 * @brief Атомарная запись JSON в файл с отступом 2
 */
void writeJsonFile(const std::filesystem::path& path, const nlohmann::ordered_json& j);

} // namespace drilltrace::io

/**
 * @file column_standardizer.hpp
 * @brief Приведение имён колонок к каноническим полям
 *
 * Произвольные имена колонок исходных таблиц нормализуются и
 * переименовываются по таблице синонимов (model/datamodel.hpp),
 * дополненной пользовательскими переопределениями.
 */

#pragma once

#include "model/row.hpp"
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Пользовательские переопределения: исходное имя → каноническое
 */
using ColumnOverrides = std::map<std::string, std::string>;

/**
 * @brief Обратный словарь: нормализованный синоним → каноническое имя
 */
using ColumnLookup = std::unordered_map<std::string, std::string>;

/**
 * @brief Нормализация имени колонки
 *
 * Обрезка пробелов, нижний регистр, серии пробелов → один '_'.
 * Пустая строка остаётся пустой.
 */
[[nodiscard]] std::string normalizeFieldName(std::string_view name);

/**
 * @brief Построение обратного словаря с учётом переопределений
 *
 * Обе стороны переопределений нормализуются, переопределения имеют
 * приоритет над встроенной таблицей.
 */
[[nodiscard]] ColumnLookup buildColumnLookup(const ColumnOverrides& overrides = {});

/**
 * @brief Переименование колонок строки по готовому словарю
 *
 * Неизвестные колонки проходят в нормализованном виде. Если две
 * колонки дают одно каноническое имя, остаётся первая.
 */
[[nodiscard]] Row applyColumnLookup(const Row& row, const ColumnLookup& lookup);

/**
 * @brief Переименование колонок одной строки
 */
[[nodiscard]] Row standardizeColumns(const Row& row, const ColumnOverrides& overrides = {});

/**
 * @brief Переименование колонок всех строк таблицы
 */
[[nodiscard]] Table standardizeTable(const Table& table, const ColumnOverrides& overrides = {});

} // namespace drilltrace::core

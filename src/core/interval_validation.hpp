/**
 * @file interval_validation.hpp
 * @brief Проверки интервальных данных и инклинометрии
 *
 * validateNoOverlappingIntervals прерывает загрузку исключением.
 * Остальные функции собирают отчёт ValidationResult, ничего не бросая.
 */

#pragma once

#include "model/records.hpp"
#include "model/validation.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Проверка отсутствия перекрытий интервалов внутри скважины
 *
 * Интервалы упорядочиваются по (hole_id, from, to). Соприкасающиеся
 * интервалы (from == предыдущий to) допустимы.
 *
 * @param label Название набора данных для сообщения ("Geology")
 * @throws OverlapError при первом from < предыдущего to
 */
void validateNoOverlappingIntervals(const IntervalList& intervals, std::string_view label);

/**
 * @brief Отчёт по интервалам: пропуски глубин, неположительная длина, перекрытия
 *
 * Работает со стандартизованными строками до загрузки.
 */
[[nodiscard]] ValidationResult validateIntervals(const Table& rows);

/**
 * @brief Отчёт по инклинометрии: убывающие глубины станций
 *
 * Порядок проверяется в порядке строк входных данных.
 */
[[nodiscard]] ValidationResult validateSurveys(const Table& rows);

/**
 * @brief Отчёт по структурным замерам: dip в [0, 90], azimuth в [0, 360)
 *
 * Отсутствующие углы не проверяются.
 */
[[nodiscard]] ValidationResult validateStructuralMeasurements(const IntervalList& measurements);

/**
 * @brief Обязательные колонки, которых нет ни в одной строке
 */
[[nodiscard]] std::vector<std::string> reportMissingColumns(
    const Table& rows, const std::vector<std::string>& required);

} // namespace drilltrace::core

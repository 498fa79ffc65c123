/**
 * @file compositing.hpp
 * @brief Композитирование интервалов и передискретизация траекторий
 */

#pragma once

#include "model/records.hpp"
#include <string>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Способ агрегации значения в композите
 */
enum class CompositeMethod {
    Average,  ///< Среднее, взвешенное по длине перекрытия
    Sum       ///< Сумма значение × длина перекрытия
};

/**
 * @brief Композитирование интервалов на отрезки фиксированной длины
 *
 * Для каждой скважины отрезки [start, start + length), ... покрывают
 * диапазон [min from, max to]. Отрезки без перекрывающихся интервалов
 * с числовым значением пропускаются.
 *
 * @param value_column Колонка значения
 * @param length Длина композита, > 0
 * @throws InvalidValueError при некорректной длине
 */
[[nodiscard]] IntervalList compositeIntervals(
    const IntervalList& intervals,
    const std::string& value_column,
    Meters length,
    CompositeMethod method = CompositeMethod::Average
);

/**
 * @brief Передискретизация траекторий с постоянным шагом по md
 *
 * Координаты и углы интерполируются линейно между соседними точками.
 *
 * @throws InvalidValueError при некорректном шаге
 */
[[nodiscard]] TraceList resampleTrace(const TraceList& points, Meters step);

} // namespace drilltrace::core

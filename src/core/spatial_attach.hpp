/**
 * @file spatial_attach.hpp
 * @brief Привязка интервальных данных к траекториям скважин
 */

#pragma once

#include "model/records.hpp"
#include <optional>
#include <string>
#include <vector>

namespace drilltrace::core {

using namespace drilltrace::model;

/// Суффикс для полей траектории, уже присутствующих в интервале
inline constexpr const char* kTraceSuffix = "_trace";

/**
 * @brief Привязка интервалов к ближайшей по глубине точке траектории
 *
 * mid пересчитывается как (from + to) / 2. Для каждого интервала с
 * конечным mid в точках той же скважины ищется минимум |md - mid|,
 * при равенстве берётся первая точка по возрастанию md. Точки с
 * некорректным md не участвуют. В интервал переносятся md, x, y, z, azimuth, dip;
 * если поле уже есть, оно записывается с суффиксом _trace.
 * Интервалы без точек или с некорректным mid проходят без изменений.
 *
 * @param hole_id_column Колонка-псевдоним идентификатора для обеих сторон
 */
[[nodiscard]] IntervalList attachAssayPositions(
    const IntervalList& intervals,
    const TraceList& traces,
    const std::optional<std::string>& hole_id_column = std::nullopt
);

/**
 * @brief Точное соединение интервалов с точками по набору колонок
 *
 * Ключ — значения колонок on_columns, соединённые через '|'. При
 * повторе ключа в траекториях используется последняя точка. Переносятся
 * все поля точки, кроме колонок ключа, с той же политикой суффикса.
 */
[[nodiscard]] IntervalList joinAssaysToTraces(
    const IntervalList& intervals,
    const TraceList& traces,
    const std::vector<std::string>& on_columns = {"hole_id"}
);

} // namespace drilltrace::core

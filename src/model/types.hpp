/**
 * @file types.hpp
 * @brief Базовые типы и перечисления расчёта траекторий
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace drilltrace::model {

/**
 * @brief Метод интерполяции траектории между станциями инклинометрии
 */
enum class DesurveyMethod {
    Tangential,          ///< Направление начальной станции на весь интервал
    BalancedTangential,  ///< Среднее арифметическое углов двух станций
    MinimumCurvature     ///< Дуга минимальной кривизны с ratio factor
};

/**
 * @brief Ориентация ствола в точке
 *
 * Азимут по часовой от севера, dip от горизонта (отрицательный вниз).
 */
struct Orientation {
    Degrees azimuth{0.0};
    Degrees dip{0.0};

    constexpr bool operator==(const Orientation&) const noexcept = default;
};

/**
 * @brief 3D координата в локальной плоской системе
 */
struct Coordinate3D {
    double x = 0.0;  ///< Восток (+)
    double y = 0.0;  ///< Север (+)
    double z = 0.0;  ///< Отметка (вверх +)

    constexpr bool operator==(const Coordinate3D&) const noexcept = default;
};

/**
 * @brief Смещение за интервал по стволу
 *
 * Вертикальная составляющая считается вниз положительной.
 */
struct SegmentDisplacement {
    double east = 0.0;
    double north = 0.0;
    double down = 0.0;
};

/**
 * @brief Параметры построения траекторий
 */
struct DesurveyConfig {
    double step = 1.0;                              ///< Шаг по стволу, м
    DesurveyMethod method = DesurveyMethod::MinimumCurvature;
    std::optional<std::string> hole_id_column;      ///< Колонка-псевдоним идентификатора
};

/**
 * @brief Преобразование DesurveyMethod в строку
 */
[[nodiscard]] std::string toString(DesurveyMethod method);

/**
 * @brief Парсинг DesurveyMethod из строки
 *
 * Принимает snake_case имена ("minimum_curvature") без учёта регистра.
 * @return nullopt для неизвестного имени
 */
[[nodiscard]] std::optional<DesurveyMethod> parseDesurveyMethod(std::string_view str);

/**
 * @brief Человекочитаемое название метода
 */
[[nodiscard]] std::string methodDisplayName(DesurveyMethod method);

} // namespace drilltrace::model

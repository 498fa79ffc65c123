/**
 * @file angle_utils.hpp
 * @brief Утилиты для работы с углами ориентации ствола
 *
 * Съёмка задаёт ориентацию парой (азимут, dip). Для расчёта смещений
 * она переводится в направляющие косинусы: восток, север, вниз.
 */

#pragma once

#include "model/types.hpp"
#include <glm/vec3.hpp>
#include <cmath>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Зенитный угол из dip
 *
 * inclination = 90° + dip, ограничивается диапазоном [0°, 180°].
 * dip = -90° (вертикально вниз) → 0°, dip = 0° (горизонт) → 90°.
 */
[[nodiscard]] Degrees inclinationFromDip(Degrees dip) noexcept;

/**
 * @brief Направляющие косинусы ориентации
 *
 * x = sin(inc)·sin(az) (восток), y = sin(inc)·cos(az) (север),
 * z = cos(inc) (вниз положительно).
 */
[[nodiscard]] glm::dvec3 directionCosines(Degrees azimuth, Degrees dip) noexcept;

[[nodiscard]] inline glm::dvec3 directionCosines(const Orientation& o) noexcept {
    return directionCosines(o.azimuth, o.dip);
}

/**
 * @brief Среднее арифметическое двух ориентаций
 *
 * Азимут усредняется без учёта перехода через 0°/360°.
 */
[[nodiscard]] Orientation meanOrientation(const Orientation& a, const Orientation& b) noexcept;

/**
 * @brief Линейная интерполяция ориентации по доле интервала
 *
 * @param weight Доля пройденного интервала [0, 1]
 */
[[nodiscard]] Orientation interpolateOrientation(
    const Orientation& a, const Orientation& b, double weight) noexcept;

/**
 * @brief Линейная интерполяция числового значения
 */
[[nodiscard]] inline double interpolate(
    double target,
    double v1, double d1,
    double v2, double d2
) noexcept {
    if (std::abs(d2 - d1) < 1e-9) {
        return v1;
    }
    double ratio = (target - d1) / (d2 - d1);
    return v1 + ratio * (v2 - v1);
}

} // namespace drilltrace::core

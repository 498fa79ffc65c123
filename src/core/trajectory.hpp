/**
 * @file trajectory.hpp
 * @brief Методы расчёта смещения на интервале между станциями
 *
 * Реализация методов: Tangential, Balanced Tangential, Minimum Curvature.
 * Все функции принимают длину по стволу и ориентации концов интервала
 * и возвращают смещение {восток, север, вниз}.
 */

#pragma once

#include "model/types.hpp"
#include <memory>
#include <string_view>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Тангенциальный метод
 *
 * Весь интервал проходится в направлении начальной станции.
 *
 * @param length Длина по стволу
 * @param s0 Ориентация начальной станции
 * @param s1 Ориентация конечной станции (не используется)
 */
[[nodiscard]] SegmentDisplacement tangential(
    Meters length, const Orientation& s0, const Orientation& s1
) noexcept;

/**
 * @brief Балансный тангенциальный метод
 *
 * Направление берётся по среднему арифметическому азимута и dip
 * двух станций.
 */
[[nodiscard]] SegmentDisplacement balancedTangential(
    Meters length, const Orientation& s0, const Orientation& s1
) noexcept;

/**
 * @brief Метод минимальной кривизны
 *
 * Смещение = L/2 · (dc0 + dc1) · RF, где dc — направляющие косинусы,
 * RF — ratio factor угла искривления.
 */
[[nodiscard]] SegmentDisplacement minimumCurvature(
    Meters length, const Orientation& s0, const Orientation& s1
) noexcept;

/**
 * @brief Расчёт смещения заданным методом
 */
[[nodiscard]] SegmentDisplacement calculateDisplacement(
    Meters length, const Orientation& s0, const Orientation& s1,
    DesurveyMethod method
) noexcept;

/**
 * @brief Угол искривления (dogleg) между двумя ориентациями
 *
 * acos скалярного произведения направляющих косинусов, аргумент
 * ограничен [-1, 1].
 */
[[nodiscard]] Radians doglegAngle(const Orientation& s0, const Orientation& s1) noexcept;

/**
 * @brief Расчёт Ratio Factor для метода минимальной кривизны
 *
 * RF = (2/DL) * tan(DL/2). При DL <= 1e-6 возвращает 1.0.
 */
[[nodiscard]] double calculateRatioFactor(Radians dogleg) noexcept;

/**
 * @brief Интерфейс калькулятора интервала
 */
class ISegmentCalculator {
public:
    virtual ~ISegmentCalculator() = default;

    /**
     * @brief Смещение на подшаге длиной length внутри интервала s0→s1
     */
    [[nodiscard]] virtual SegmentDisplacement displacement(
        Meters length, const Orientation& s0, const Orientation& s1
    ) const noexcept = 0;

    /**
     * @brief Ориентация, записываемая в точку подшага
     *
     * @param weight Доля интервала, пройденная к концу подшага
     */
    [[nodiscard]] virtual Orientation orientationAt(
        const Orientation& s0, const Orientation& s1, double weight
    ) const noexcept = 0;

    [[nodiscard]] virtual DesurveyMethod method() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Фабрика калькуляторов
 */
[[nodiscard]] std::unique_ptr<ISegmentCalculator> createCalculator(DesurveyMethod method);

} // namespace drilltrace::core

/**
 * @file units.hpp
 * @brief Строго типизированные единицы измерения
 *
 * Обёртки над double для углов и расстояний. Углы съёмки хранятся
 * в градусах, тригонометрия считается в радианах.
 */

#pragma once

#include <cmath>
#include <compare>
#include <numbers>

namespace drilltrace::model {

struct Radians;

/**
 * @brief Угол в градусах
 */
struct Degrees {
    double value;

    constexpr explicit Degrees(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Radians toRadians() const noexcept;

    constexpr Degrees operator+(Degrees other) const noexcept {
        return Degrees{value + other.value};
    }

    constexpr Degrees operator-(Degrees other) const noexcept {
        return Degrees{value - other.value};
    }

    constexpr Degrees operator*(double scalar) const noexcept {
        return Degrees{value * scalar};
    }

    constexpr Degrees operator/(double scalar) const noexcept {
        return Degrees{value / scalar};
    }

    constexpr auto operator<=>(const Degrees& other) const noexcept = default;
};

/**
 * @brief Угол в радианах
 */
struct Radians {
    double value;

    constexpr explicit Radians(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Degrees toDegrees() const noexcept {
        return Degrees{value * 180.0 / std::numbers::pi};
    }

    constexpr auto operator<=>(const Radians& other) const noexcept = default;
};

constexpr Radians Degrees::toRadians() const noexcept {
    return Radians{value * std::numbers::pi / 180.0};
}

/**
 * @brief Расстояние (глубина по стволу, шаг) в метрах
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator*(double scalar) const noexcept {
        return Meters{value * scalar};
    }

    constexpr Meters& operator+=(Meters other) noexcept {
        value += other.value;
        return *this;
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

namespace literals {

constexpr Degrees operator""_deg(long double v) noexcept {
    return Degrees{static_cast<double>(v)};
}

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

} // namespace literals

} // namespace drilltrace::model

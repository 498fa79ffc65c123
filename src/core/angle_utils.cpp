/**
 * @file angle_utils.cpp
 * @brief Реализация утилит для работы с углами
 */

#include "angle_utils.hpp"
#include <algorithm>

namespace drilltrace::core {

Degrees inclinationFromDip(Degrees dip) noexcept {
    return Degrees{std::clamp(90.0 + dip.value, 0.0, 180.0)};
}

glm::dvec3 directionCosines(Degrees azimuth, Degrees dip) noexcept {
    double inc = inclinationFromDip(dip).toRadians().value;
    double az = azimuth.toRadians().value;

    return glm::dvec3{
        std::sin(inc) * std::sin(az),
        std::sin(inc) * std::cos(az),
        std::cos(inc)
    };
}

Orientation meanOrientation(const Orientation& a, const Orientation& b) noexcept {
    return {
        Degrees{0.5 * (a.azimuth.value + b.azimuth.value)},
        Degrees{0.5 * (a.dip.value + b.dip.value)}
    };
}

Orientation interpolateOrientation(const Orientation& a, const Orientation& b, double weight) noexcept {
    return {
        Degrees{a.azimuth.value + weight * (b.azimuth.value - a.azimuth.value)},
        Degrees{a.dip.value + weight * (b.dip.value - a.dip.value)}
    };
}

} // namespace drilltrace::core

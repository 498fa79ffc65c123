/**
 * @file trajectory.cpp
 * @brief Реализация методов расчёта смещения на интервале
 */

#include "trajectory.hpp"
#include "angle_utils.hpp"
#include <glm/geometric.hpp>
#include <algorithm>
#include <cmath>

namespace drilltrace::core {

namespace {

SegmentDisplacement scaled(const glm::dvec3& direction, double factor) noexcept {
    return {direction.x * factor, direction.y * factor, direction.z * factor};
}

} // namespace

SegmentDisplacement tangential(
    Meters length, const Orientation& s0, const Orientation& /*s1*/
) noexcept {
    return scaled(directionCosines(s0), length.value);
}

SegmentDisplacement balancedTangential(
    Meters length, const Orientation& s0, const Orientation& s1
) noexcept {
    return scaled(directionCosines(meanOrientation(s0, s1)), length.value);
}

Radians doglegAngle(const Orientation& s0, const Orientation& s1) noexcept {
    // Ограничение для защиты от ошибок округления
    double cos_dl = std::clamp(glm::dot(directionCosines(s0), directionCosines(s1)), -1.0, 1.0);
    return Radians{std::acos(cos_dl)};
}

double calculateRatioFactor(Radians dogleg) noexcept {
    double DL = dogleg.value;

    // При малом dogleg RF ≈ 1
    if (DL <= 1e-6) {
        return 1.0;
    }

    return (2.0 / DL) * std::tan(DL / 2.0);
}

SegmentDisplacement minimumCurvature(
    Meters length, const Orientation& s0, const Orientation& s1
) noexcept {
    glm::dvec3 dc0 = directionCosines(s0);
    glm::dvec3 dc1 = directionCosines(s1);

    double RF = calculateRatioFactor(doglegAngle(s0, s1));
    return scaled(dc0 + dc1, 0.5 * length.value * RF);
}

SegmentDisplacement calculateDisplacement(
    Meters length, const Orientation& s0, const Orientation& s1,
    DesurveyMethod method
) noexcept {
    switch (method) {
        case DesurveyMethod::Tangential:
            return tangential(length, s0, s1);

        case DesurveyMethod::BalancedTangential:
            return balancedTangential(length, s0, s1);

        case DesurveyMethod::MinimumCurvature:
            return minimumCurvature(length, s0, s1);
    }
    return minimumCurvature(length, s0, s1);
}

// === Реализация калькуляторов через интерфейс ===

namespace {

class TangentialCalculator : public ISegmentCalculator {
public:
    SegmentDisplacement displacement(
        Meters length, const Orientation& s0, const Orientation& s1
    ) const noexcept override {
        return tangential(length, s0, s1);
    }

    Orientation orientationAt(
        const Orientation& s0, const Orientation& /*s1*/, double /*weight*/
    ) const noexcept override {
        return s0;
    }

    DesurveyMethod method() const noexcept override {
        return DesurveyMethod::Tangential;
    }

    std::string_view name() const noexcept override {
        return "Тангенциальный";
    }
};

class BalancedTangentialCalculator : public ISegmentCalculator {
public:
    SegmentDisplacement displacement(
        Meters length, const Orientation& s0, const Orientation& s1
    ) const noexcept override {
        return balancedTangential(length, s0, s1);
    }

    Orientation orientationAt(
        const Orientation& s0, const Orientation& s1, double /*weight*/
    ) const noexcept override {
        return meanOrientation(s0, s1);
    }

    DesurveyMethod method() const noexcept override {
        return DesurveyMethod::BalancedTangential;
    }

    std::string_view name() const noexcept override {
        return "Балансный тангенциальный";
    }
};

class MinimumCurvatureCalculator : public ISegmentCalculator {
public:
    SegmentDisplacement displacement(
        Meters length, const Orientation& s0, const Orientation& s1
    ) const noexcept override {
        return minimumCurvature(length, s0, s1);
    }

    // Линейная интерполяция углов, без перехода через 0°/360°
    Orientation orientationAt(
        const Orientation& s0, const Orientation& s1, double weight
    ) const noexcept override {
        return interpolateOrientation(s0, s1, weight);
    }

    DesurveyMethod method() const noexcept override {
        return DesurveyMethod::MinimumCurvature;
    }

    std::string_view name() const noexcept override {
        return "Минимальная кривизна";
    }
};

} // anonymous namespace

std::unique_ptr<ISegmentCalculator> createCalculator(DesurveyMethod method) {
    switch (method) {
        case DesurveyMethod::Tangential:
            return std::make_unique<TangentialCalculator>();

        case DesurveyMethod::BalancedTangential:
            return std::make_unique<BalancedTangentialCalculator>();

        case DesurveyMethod::MinimumCurvature:
            return std::make_unique<MinimumCurvatureCalculator>();
    }
    return std::make_unique<MinimumCurvatureCalculator>();
}

} // namespace drilltrace::core

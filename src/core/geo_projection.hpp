/**
 * @file geo_projection.hpp
 * @brief Локальная плоская аппроксимация для устьев в широте/долготе
 *
 * Устья, заданные только широтой и долготой, переводятся в метры
 * относительно первого такого устья набора. Траектория строится в
 * метрах, для точек вычисляются приближённые широта и долгота.
 */

#pragma once

#include "model/records.hpp"
#include <glm/vec2.hpp>

namespace drilltrace::core {

using namespace drilltrace::model;

inline constexpr double kMetersPerDegreeLatitude = 111132.0;
inline constexpr double kMetersPerDegreeLongitudeAtEquator = 111320.0;

/**
 * @brief Географическая точка, градусы
 */
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief Метров в градусе долготы на заданной широте
 */
[[nodiscard]] double metersPerDegreeLongitude(double latitude) noexcept;

/**
 * @brief Смещение {восток, север} точки от начала отсчёта, м
 *
 * Масштаб долготы берётся по широте начала отсчёта.
 */
[[nodiscard]] glm::dvec2 geographicToLocal(const GeoPoint& origin, const GeoPoint& point) noexcept;

/**
 * @brief Обратное преобразование смещения {восток, север} около origin
 *
 * Вблизи полюса, где градус долготы вырождается, долгота не меняется.
 */
[[nodiscard]] GeoPoint localToGeographic(const GeoPoint& origin, const glm::dvec2& offset) noexcept;

/**
 * @brief Устье задано только широтой/долготой (без easting/northing)
 */
[[nodiscard]] bool isGeographicCollar(const Collar& collar) noexcept;

/**
 * @brief Размещение географических устьев в локальной плоскости
 *
 * x/y таких устьев становятся смещением в метрах от первого
 * географического устья списка. Устья с easting/northing не меняются.
 */
void projectGeographicCollars(CollarList& collars);

} // namespace drilltrace::core

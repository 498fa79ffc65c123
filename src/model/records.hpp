/**
 * @file records.hpp
 * @brief Типизированные записи: устье, станция, интервал, точка траектории
 *
 * Каждая запись хранит канонические поля явно, а прочие колонки
 * исходной строки сохраняются в extra без изменений.
 */

#pragma once

#include "row.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::model {

/**
 * @brief Устье скважины
 */
struct Collar {
    std::string hole_id;
    std::string datasource_hole_id;  ///< По умолчанию совпадает с hole_id
    Coordinate3D position;           ///< x/y в метрах (easting/northing либо локальная плоскость), z: отметка

    std::optional<double> easting;
    std::optional<double> northing;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> elevation;
    std::string project_id;
    std::string crs;

    Row extra;  ///< Прочие колонки

    /**
     * @brief Значение поля по каноническому имени или имени из extra
     */
    [[nodiscard]] CellValue field(std::string_view name) const;

    /**
     * @brief Полная строка: канонические поля и extra
     */
    [[nodiscard]] Row toRow() const;
};

/**
 * @brief Станция инклинометрии
 */
struct SurveyStation {
    std::string hole_id;
    double from = 0.0;                ///< Глубина по стволу, м
    std::optional<double> to;
    double azimuth = 0.0;             ///< Градусы по часовой от севера
    double dip = 0.0;                 ///< Градусы от горизонта, вниз отрицательный
    std::optional<double> declination; ///< Принимается как есть, не применяется

    Row extra;

    [[nodiscard]] Orientation orientation() const noexcept {
        return {Degrees{azimuth}, Degrees{dip}};
    }

    [[nodiscard]] CellValue field(std::string_view name) const;
    [[nodiscard]] Row toRow() const;
};

/**
 * @brief Интервал опробования или геологического описания
 */
struct Interval {
    std::string hole_id;
    double from = 0.0;
    double to = 0.0;
    double mid = 0.0;  ///< (from + to) / 2

    Row extra;  ///< Значения анализов, коды пород, присоединённые поля траектории

    [[nodiscard]] double length() const noexcept { return to - from; }

    [[nodiscard]] bool hasField(std::string_view name) const noexcept;
    [[nodiscard]] CellValue field(std::string_view name) const;

    /**
     * @brief Запись поля: канонические числовые поля обновляются напрямую
     */
    void setField(std::string name, CellValue value);

    [[nodiscard]] Row toRow() const;
};

/**
 * @brief Точка траектории
 */
struct TracePoint {
    std::string hole_id;
    double md = 0.0;         ///< Глубина по стволу, м
    Coordinate3D position;
    double azimuth = 0.0;
    double dip = 0.0;

    /// Приближённые широта и долгота для устьев, заданных в градусах
    std::optional<double> latitude;
    std::optional<double> longitude;

    /// Колонка-псевдоним идентификатора (если отличается от hole_id) и её значение
    std::optional<std::string> alias_column;
    CellValue alias_value;

    [[nodiscard]] CellValue field(std::string_view name) const;

    /**
     * @brief Имена всех полей точки в порядке вывода
     */
    [[nodiscard]] std::vector<std::string> fieldNames() const;

    [[nodiscard]] Row toRow() const;
};

using CollarList = std::vector<Collar>;
using SurveyList = std::vector<SurveyStation>;
using IntervalList = std::vector<Interval>;
using TraceList = std::vector<TracePoint>;

} // namespace drilltrace::model

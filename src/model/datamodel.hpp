/**
 * @file datamodel.hpp
 * @brief Каноническая схема данных скважин
 *
 * Имена полей, таблица синонимов колонок и списки полей по типам
 * таблиц (устья, инклинометрия, опробование, геология, структурные
 * замеры).
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::model {

namespace fields {

inline constexpr const char* kHoleId = "hole_id";
inline constexpr const char* kDatasourceHoleId = "datasource_hole_id";
inline constexpr const char* kProjectId = "project_id";
inline constexpr const char* kCollarId = "collar_id";
inline constexpr const char* kAnumber = "anumber";
inline constexpr const char* kPrimaryId = "primary_id";

inline constexpr const char* kLatitude = "latitude";
inline constexpr const char* kLongitude = "longitude";
inline constexpr const char* kElevation = "elevation";
inline constexpr const char* kEasting = "easting";
inline constexpr const char* kNorthing = "northing";
inline constexpr const char* kCrs = "crs";

inline constexpr const char* kFrom = "from";
inline constexpr const char* kTo = "to";
inline constexpr const char* kMid = "mid";
inline constexpr const char* kAzimuth = "azimuth";
inline constexpr const char* kDip = "dip";
inline constexpr const char* kDeclination = "declination";

inline constexpr const char* kGeologyCode = "geology_code";
inline constexpr const char* kGeologyDescription = "geology_description";

inline constexpr const char* kStructureType = "structure_type";

inline constexpr const char* kMd = "md";
inline constexpr const char* kX = "x";
inline constexpr const char* kY = "y";
inline constexpr const char* kZ = "z";

} // namespace fields

/// Версия таблицы синонимов; меняется при любом изменении состава
inline constexpr int kColumnMapVersion = 2;

/**
 * @brief Каноническое поле и его синонимы в исходных данных
 */
struct ColumnAliases {
    std::string canonical;
    std::vector<std::string> aliases;  ///< Уже в нормализованном виде
};

/**
 * @brief Встроенная таблица синонимов колонок
 */
[[nodiscard]] const std::vector<ColumnAliases>& defaultColumnMap();

[[nodiscard]] const std::vector<std::string>& collarFields();
[[nodiscard]] const std::vector<std::string>& surveyFields();
[[nodiscard]] const std::vector<std::string>& assayFields();
[[nodiscard]] const std::vector<std::string>& geologyFields();
[[nodiscard]] const std::vector<std::string>& structuralFields();

/**
 * @brief Поля, которые присоединение к траектории переносит в интервал
 */
[[nodiscard]] const std::vector<std::string>& traceAttachFields();

} // namespace drilltrace::model

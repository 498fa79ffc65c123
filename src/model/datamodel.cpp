/**
 * @file datamodel.cpp
 * @brief Таблица синонимов колонок и списки канонических полей
 */

#include "datamodel.hpp"

namespace drilltrace::model {

const std::vector<ColumnAliases>& defaultColumnMap() {
    // Синонимы записаны после normalizeFieldName: нижний регистр, пробелы → '_'
    static const std::vector<ColumnAliases> kMap = {
        // Идентификаторы
        {fields::kHoleId, {"hole_id", "holeid", "hole-id"}},
        {fields::kDatasourceHoleId, {"datasource_hole_id", "datasourceholeid", "datasource-hole-id",
                                     "company_hole_id", "companyholeid", "company-hole-id"}},
        {fields::kProjectId, {"project_id", "projectid", "project-id",
                              "project_code", "projectcode", "project-code",
                              "company_id", "companyid", "company-id", "dataset", "project"}},
        {fields::kCollarId, {"collar_id", "collarid"}},
        {fields::kAnumber, {"anumber", "a_number"}},

        // Положение устья
        {fields::kLatitude, {"latitude", "lat"}},
        {fields::kLongitude, {"longitude", "lon", "long"}},
        {fields::kElevation, {"elevation", "rl", "elev", "z"}},
        {fields::kEasting, {"easting", "x"}},
        {fields::kNorthing, {"northing", "y"}},
        {fields::kCrs, {"crs", "epsg", "projection"}},

        // Интервалы и глубины станций
        {fields::kFrom, {"from", "depth_from", "from_depth", "samp_from", "sample_from",
                         "sampfrom", "fromdepth", "depth", "survey_depth", "surveydepth"}},
        {fields::kTo, {"to", "depth_to", "to_depth", "samp_to", "sample_to",
                       "sampto", "todepth"}},

        // Ориентация ствола
        {fields::kAzimuth, {"azimuth", "az", "azi", "dipdir", "dip_direction", "dipdirection"}},
        {fields::kDip, {"dip"}},
        {fields::kDeclination, {"declination", "dec"}},

        // Структурные замеры
        {fields::kStructureType, {"structure_type", "structuretype", "structure", "defect",
                                  "defect_type"}},

        // Геология
        {fields::kGeologyCode, {"geology_code", "geologycode", "lith1", "lith1code",
                                "lith1_code", "lithology", "plot_lithology", "rock1"}},
        {fields::kGeologyDescription, {"geology_description", "geologydescription",
                                       "geology_comment", "geologycomment",
                                       "lithology_comment", "description", "comments"}},
    };
    return kMap;
}

const std::vector<std::string>& collarFields() {
    static const std::vector<std::string> kFields = {
        fields::kHoleId, fields::kDatasourceHoleId, fields::kProjectId,
        fields::kLatitude, fields::kLongitude, fields::kElevation,
        fields::kEasting, fields::kNorthing, fields::kCrs,
    };
    return kFields;
}

const std::vector<std::string>& surveyFields() {
    static const std::vector<std::string> kFields = {
        fields::kHoleId, fields::kFrom, fields::kTo,
        fields::kAzimuth, fields::kDip, fields::kDeclination,
    };
    return kFields;
}

const std::vector<std::string>& assayFields() {
    static const std::vector<std::string> kFields = {
        fields::kHoleId, fields::kFrom, fields::kTo, fields::kMid,
    };
    return kFields;
}

const std::vector<std::string>& geologyFields() {
    static const std::vector<std::string> kFields = {
        fields::kHoleId, fields::kFrom, fields::kTo, fields::kMid,
        fields::kGeologyCode, fields::kGeologyDescription,
    };
    return kFields;
}

const std::vector<std::string>& structuralFields() {
    static const std::vector<std::string> kFields = {
        fields::kHoleId, fields::kFrom, fields::kTo, fields::kMid,
        fields::kDip, fields::kAzimuth, fields::kStructureType,
    };
    return kFields;
}

const std::vector<std::string>& traceAttachFields() {
    static const std::vector<std::string> kFields = {
        fields::kMd, fields::kX, fields::kY, fields::kZ, fields::kAzimuth, fields::kDip,
    };
    return kFields;
}

} // namespace drilltrace::model

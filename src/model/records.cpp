/**
 * @file records.cpp
 * @brief Реализация типизированных записей
 */

#include "records.hpp"
#include "datamodel.hpp"

namespace drilltrace::model {

namespace {

CellValue optionalCell(const std::optional<double>& value) {
    if (value.has_value()) {
        return *value;
    }
    return std::monostate{};
}

CellValue textCell(const std::string& value) {
    if (value.empty()) {
        return std::monostate{};
    }
    return value;
}

void appendExtra(Row& row, const Row& extra) {
    for (const auto& [name, value] : extra) {
        row.setIfAbsent(name, value);
    }
}

} // namespace

// === Collar ===

CellValue Collar::field(std::string_view name) const {
    if (name == fields::kHoleId) return textCell(hole_id);
    if (name == fields::kDatasourceHoleId) return textCell(datasource_hole_id);
    if (name == fields::kProjectId) return textCell(project_id);
    if (name == fields::kCrs) return textCell(crs);
    if (name == fields::kEasting) return optionalCell(easting);
    if (name == fields::kNorthing) return optionalCell(northing);
    if (name == fields::kLatitude) return optionalCell(latitude);
    if (name == fields::kLongitude) return optionalCell(longitude);
    if (name == fields::kElevation) return optionalCell(elevation);
    if (name == fields::kX) return position.x;
    if (name == fields::kY) return position.y;
    if (name == fields::kZ) return position.z;
    return extra.get(name);
}

Row Collar::toRow() const {
    Row row;
    row.set(fields::kHoleId, hole_id);
    row.set(fields::kDatasourceHoleId, datasource_hole_id);
    if (!project_id.empty()) row.set(fields::kProjectId, project_id);
    if (easting) row.set(fields::kEasting, *easting);
    if (northing) row.set(fields::kNorthing, *northing);
    if (latitude) row.set(fields::kLatitude, *latitude);
    if (longitude) row.set(fields::kLongitude, *longitude);
    if (elevation) row.set(fields::kElevation, *elevation);
    if (!crs.empty()) row.set(fields::kCrs, crs);
    row.set(fields::kX, position.x);
    row.set(fields::kY, position.y);
    row.set(fields::kZ, position.z);
    appendExtra(row, extra);
    return row;
}

// === SurveyStation ===

CellValue SurveyStation::field(std::string_view name) const {
    if (name == fields::kHoleId) return textCell(hole_id);
    if (name == fields::kFrom) return from;
    if (name == fields::kTo) return optionalCell(to);
    if (name == fields::kAzimuth) return azimuth;
    if (name == fields::kDip) return dip;
    if (name == fields::kDeclination) return optionalCell(declination);
    return extra.get(name);
}

Row SurveyStation::toRow() const {
    Row row;
    row.set(fields::kHoleId, hole_id);
    row.set(fields::kFrom, from);
    if (to) row.set(fields::kTo, *to);
    row.set(fields::kAzimuth, azimuth);
    row.set(fields::kDip, dip);
    if (declination) row.set(fields::kDeclination, *declination);
    appendExtra(row, extra);
    return row;
}

// === Interval ===

bool Interval::hasField(std::string_view name) const noexcept {
    return name == fields::kHoleId || name == fields::kFrom ||
           name == fields::kTo || name == fields::kMid || extra.contains(name);
}

CellValue Interval::field(std::string_view name) const {
    if (name == fields::kHoleId) return textCell(hole_id);
    if (name == fields::kFrom) return from;
    if (name == fields::kTo) return to;
    if (name == fields::kMid) return mid;
    return extra.get(name);
}

void Interval::setField(std::string name, CellValue value) {
    if (name == fields::kHoleId) {
        hole_id = toText(value);
        return;
    }
    if (name == fields::kFrom || name == fields::kTo || name == fields::kMid) {
        if (auto number = toNumber(value)) {
            if (name == fields::kFrom) from = *number;
            else if (name == fields::kTo) to = *number;
            else mid = *number;
            return;
        }
    }
    extra.set(std::move(name), std::move(value));
}

Row Interval::toRow() const {
    Row row;
    row.set(fields::kHoleId, hole_id);
    row.set(fields::kFrom, from);
    row.set(fields::kTo, to);
    row.set(fields::kMid, mid);
    appendExtra(row, extra);
    return row;
}

// === TracePoint ===

CellValue TracePoint::field(std::string_view name) const {
    if (name == fields::kHoleId) return textCell(hole_id);
    if (name == fields::kMd) return md;
    if (name == fields::kX) return position.x;
    if (name == fields::kY) return position.y;
    if (name == fields::kZ) return position.z;
    if (name == fields::kAzimuth) return azimuth;
    if (name == fields::kDip) return dip;
    if (name == fields::kLatitude) return optionalCell(latitude);
    if (name == fields::kLongitude) return optionalCell(longitude);
    if (alias_column && name == *alias_column) return alias_value;
    return std::monostate{};
}

std::vector<std::string> TracePoint::fieldNames() const {
    std::vector<std::string> names = {
        fields::kHoleId, fields::kMd, fields::kX, fields::kY, fields::kZ,
        fields::kAzimuth, fields::kDip,
    };
    if (latitude && longitude) {
        names.push_back(fields::kLatitude);
        names.push_back(fields::kLongitude);
    }
    if (alias_column) {
        names.push_back(*alias_column);
    }
    return names;
}

Row TracePoint::toRow() const {
    Row row;
    for (const auto& name : fieldNames()) {
        row.set(name, field(name));
    }
    return row;
}

} // namespace drilltrace::model

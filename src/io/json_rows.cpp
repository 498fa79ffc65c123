/**
 * @file json_rows.cpp
 * @brief Реализация обмена таблицами в формате JSON
 */

#include "json_rows.hpp"
#include "file_utils.hpp"
#include "model/data_errors.hpp"
#include "model/datamodel.hpp"
#include <algorithm>
#include <cmath>

namespace drilltrace::io {

using json = nlohmann::ordered_json;

CellValue cellFromJson(const json& j) {
    if (j.is_null()) {
        return std::monostate{};
    }
    if (j.is_number()) {
        return j.get<double>();
    }
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (j.is_boolean()) {
        return std::string(j.get<bool>() ? "true" : "false");
    }
    return j.dump();
}

json cellToJson(const CellValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        if (!std::isfinite(*number)) {
            return nullptr;
        }
        return *number;
    }
    if (const auto* str = std::get_if<std::string>(&value)) {
        return *str;
    }
    return nullptr;
}

Row rowFromJson(const json& j) {
    Row row;
    for (const auto& [key, value] : j.items()) {
        row.set(key, cellFromJson(value));
    }
    return row;
}

json rowToJson(const Row& row) {
    json j = json::object();
    for (const auto& [name, value] : row) {
        j[name] = cellToJson(value);
    }
    return j;
}

Table tableFromJson(const json& j) {
    const json* rows = &j;
    if (j.is_object() && j.contains("rows")) {
        rows = &j["rows"];
    }
    if (!rows->is_array()) {
        throw InvalidValueError("tableFromJson", "ожидается массив строк");
    }

    Table table;
    table.reserve(rows->size());
    for (size_t i = 0; i < rows->size(); ++i) {
        const auto& item = (*rows)[i];
        if (!item.is_object()) {
            throw InvalidValueError("tableFromJson", "строка должна быть объектом", i);
        }
        table.push_back(rowFromJson(item));
    }
    return table;
}

json tableToJson(const Table& table) {
    json j = json::array();
    for (const auto& row : table) {
        j.push_back(rowToJson(row));
    }
    return j;
}

Table readTableJson(const std::filesystem::path& path) {
    return withDataErrorContext("readTableJson(" + path.string() + ")", [&path]() {
        return tableFromJson(json::parse(readTextFile(path)));
    });
}

json tracesToJson(const TraceList& traces) {
    json j = json::array();
    for (const auto& point : traces) {
        j.push_back(rowToJson(point.toRow()));
    }
    return j;
}

TraceList tracesFromJson(const json& j) {
    TraceList traces;
    for (const auto& row : tableFromJson(j)) {
        TracePoint point;
        point.hole_id = row.text(fields::kHoleId);
        point.md = row.number(fields::kMd).value_or(std::nan(""));
        point.position.x = row.number(fields::kX).value_or(std::nan(""));
        point.position.y = row.number(fields::kY).value_or(std::nan(""));
        point.position.z = row.number(fields::kZ).value_or(std::nan(""));
        point.azimuth = row.number(fields::kAzimuth).value_or(std::nan(""));
        point.dip = row.number(fields::kDip).value_or(std::nan(""));
        auto latitude = row.number(fields::kLatitude);
        auto longitude = row.number(fields::kLongitude);
        if (latitude && longitude) {
            point.latitude = latitude;
            point.longitude = longitude;
        }

        // Единственное дополнительное поле: колонка-псевдоним
        for (const auto& [name, value] : row) {
            auto known = point.fieldNames();
            if (std::find(known.begin(), known.end(), name) == known.end()) {
                point.alias_column = name;
                point.alias_value = value;
                break;
            }
        }
        traces.push_back(std::move(point));
    }
    return traces;
}

json intervalsToJson(const IntervalList& intervals) {
    json j = json::array();
    for (const auto& interval : intervals) {
        j.push_back(rowToJson(interval.toRow()));
    }
    return j;
}

void writeJsonFile(const std::filesystem::path& path, const json& j) {
    atomicWrite(path, j.dump(2) + "\n");
}

} // namespace drilltrace::io

/**
 * @file loaders.cpp
 * @brief Реализация загрузчиков таблиц скважин
 */

#include "loaders.hpp"
#include "core/geo_projection.hpp"
#include "core/hole_key.hpp"
#include "core/interval_validation.hpp"
#include "core/spatial_attach.hpp"
#include "model/data_errors.hpp"
#include "model/datamodel.hpp"
#include "model/text_utils.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace drilltrace::io {

using namespace drilltrace::core;

namespace {

const std::vector<std::string> kAssayCodeColumns = {
    "assay_code", "assay_type", "analyte", "element", "code"};
const std::vector<std::string> kAssayValueColumns = {
    "assay_value", "value", "result", "assay_result"};
const std::vector<std::string> kGeologyCodeColumns = {
    fields::kGeologyCode, "lith_code", "code"};
const std::vector<std::string> kGeologyValueColumns = {
    fields::kGeologyDescription, "geology_value", "value", "description"};

bool isSchemaField(const std::vector<std::string>& schema, const std::string& name) {
    return std::find(schema.begin(), schema.end(), name) != schema.end();
}

/**
 * @brief Стандартизация, разворот и канонизация идентификатора
 */
Table prepareRows(const Table& rows, const LoadOptions& options, std::string_view operation,
                  const std::vector<std::string>* code_columns = nullptr,
                  const std::vector<std::string>* value_columns = nullptr) {
    auto lookup = buildColumnLookup(options.column_overrides);

    Table prepared;
    prepared.reserve(rows.size());
    for (const auto& row : rows) {
        prepared.push_back(applyColumnLookup(row, lookup));
    }

    if (!options.flat && code_columns != nullptr && value_columns != nullptr) {
        prepared = flattenLongFormat(prepared, operation, *code_columns, *value_columns);
    }

    if (options.hole_id_column.has_value()) {
        // Имя колонки проходит ту же стандартизацию, что и заголовки
        auto normalized = normalizeFieldName(*options.hole_id_column);
        auto it = lookup.find(normalized);
        std::string column = it != lookup.end() ? it->second : normalized;
        prepared = canonicalizeHoleIds(std::move(prepared), column, operation).items;
    }

    if (!tableHasColumn(prepared, fields::kHoleId)) {
        throw MissingColumnError(std::string(operation), fields::kHoleId);
    }
    return prepared;
}

void requireColumns(const Table& rows, std::string_view operation,
                    const std::vector<std::string>& required) {
    auto missing = reportMissingColumns(rows, required);
    if (!missing.empty()) {
        throw MissingColumnError(std::string(operation), missing.front());
    }
}

std::string requireHoleId(const Row& row, std::string_view operation, size_t index) {
    auto hole_id = normalizeHoleIdValue(row.get(fields::kHoleId));
    if (hole_id.empty()) {
        throw InvalidValueError(std::string(operation), "пустой hole_id", index);
    }
    return hole_id;
}

double requireNumber(const Row& row, const char* column, std::string_view operation, size_t index) {
    auto value = row.number(column);
    if (!value.has_value()) {
        throw InvalidValueError(std::string(operation),
            std::string("некорректное значение в колонке '") + column + "'", index);
    }
    return *value;
}

std::optional<double> optionalNumber(const Row& row, const char* column,
                                     std::string_view operation, size_t index) {
    if (!row.hasValue(column)) {
        return std::nullopt;
    }
    return requireNumber(row, column, operation, index);
}

void requireIncreasing(double from, double to, std::string_view operation, size_t index) {
    if (!(to > from)) {
        throw InvalidValueError(std::string(operation),
            "конец интервала 'to' должен быть больше начала 'from'", index);
    }
}

Row collectExtra(const Row& row, const std::vector<std::string>& schema, bool keep_all) {
    Row extra;
    if (!keep_all) {
        return extra;
    }
    for (const auto& [name, value] : row) {
        if (!isSchemaField(schema, name)) {
            extra.set(name, value);
        }
    }
    return extra;
}

bool intervalLess(const Interval& a, const Interval& b) {
    if (a.hole_id != b.hole_id) return a.hole_id < b.hole_id;
    if (a.from != b.from) return a.from < b.from;
    return a.to < b.to;
}

Interval makeInterval(const Row& row, std::string hole_id, double from, double to,
                      const std::vector<std::string>& schema, bool keep_all) {
    Interval interval;
    interval.hole_id = std::move(hole_id);
    interval.from = from;
    interval.to = to;
    interval.mid = 0.5 * (from + to);
    interval.extra = collectExtra(row, schema, keep_all);
    return interval;
}

/**
 * @brief Углы и тип структуры в extra: числа и текст вместо исходных ячеек
 */
void setStructuralFields(Interval& measurement, const Row& row,
                         std::string_view operation, size_t index) {
    for (const char* column : {fields::kDip, fields::kAzimuth}) {
        if (auto value = optionalNumber(row, column, operation, index)) {
            measurement.extra.set(column, *value);
        }
    }
    if (row.hasValue(fields::kStructureType)) {
        measurement.extra.set(fields::kStructureType, trim(row.text(fields::kStructureType)));
    }
}

} // namespace

Table loadTable(const Table& rows, const LoadOptions& options) {
    return standardizeTable(rows, options.column_overrides);
}

CollarList loadCollars(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadCollars";
    auto prepared = prepareRows(rows, options, kOp);

    bool has_xy = tableHasColumn(prepared, fields::kEasting) &&
                  tableHasColumn(prepared, fields::kNorthing);
    bool has_latlon = tableHasColumn(prepared, fields::kLatitude) &&
                      tableHasColumn(prepared, fields::kLongitude);
    if (!has_xy && !has_latlon) {
        requireColumns(prepared, kOp, {fields::kEasting, fields::kNorthing});
        requireColumns(prepared, kOp, {fields::kLatitude, fields::kLongitude});
    }

    CollarList collars;
    collars.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];

        Collar collar;
        collar.hole_id = requireHoleId(row, kOp, i);
        collar.easting = optionalNumber(row, fields::kEasting, kOp, i);
        collar.northing = optionalNumber(row, fields::kNorthing, kOp, i);
        collar.latitude = optionalNumber(row, fields::kLatitude, kOp, i);
        collar.longitude = optionalNumber(row, fields::kLongitude, kOp, i);
        collar.elevation = optionalNumber(row, fields::kElevation, kOp, i);

        if (collar.easting && collar.northing) {
            collar.position.x = *collar.easting;
            collar.position.y = *collar.northing;
        } else if (!(collar.longitude && collar.latitude)) {
            throw InvalidValueError(std::string(kOp),
                "нет координат устья (easting/northing или latitude/longitude)", i);
        }
        collar.position.z = collar.elevation.value_or(0.0);

        collar.datasource_hole_id = row.hasValue(fields::kDatasourceHoleId)
            ? trim(row.text(fields::kDatasourceHoleId))
            : collar.hole_id;
        collar.project_id = trim(row.text(fields::kProjectId));
        collar.crs = trim(row.text(fields::kCrs));
        collar.extra = collectExtra(row, collarFields(), options.keep_all);

        collars.push_back(std::move(collar));
    }

    projectGeographicCollars(collars);
    return collars;
}

SurveyList loadSurveys(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadSurveys";
    auto prepared = prepareRows(rows, options, kOp);
    requireColumns(prepared, kOp, {fields::kFrom, fields::kAzimuth, fields::kDip});

    SurveyList surveys;
    surveys.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];

        SurveyStation station;
        station.hole_id = requireHoleId(row, kOp, i);
        station.from = requireNumber(row, fields::kFrom, kOp, i);
        station.azimuth = requireNumber(row, fields::kAzimuth, kOp, i);
        station.dip = requireNumber(row, fields::kDip, kOp, i);
        station.to = optionalNumber(row, fields::kTo, kOp, i);
        station.declination = optionalNumber(row, fields::kDeclination, kOp, i);
        station.extra = collectExtra(row, surveyFields(), options.keep_all);

        surveys.push_back(std::move(station));
    }

    std::stable_sort(surveys.begin(), surveys.end(),
        [](const SurveyStation& a, const SurveyStation& b) {
            if (a.hole_id != b.hole_id) return a.hole_id < b.hole_id;
            return a.from < b.from;
        });
    return surveys;
}

IntervalList loadAssays(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadAssays";
    auto prepared = prepareRows(rows, options, kOp, &kAssayCodeColumns, &kAssayValueColumns);
    requireColumns(prepared, kOp, {fields::kFrom, fields::kTo});

    IntervalList assays;
    assays.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];
        auto hole_id = requireHoleId(row, kOp, i);
        double from = requireNumber(row, fields::kFrom, kOp, i);
        double to = requireNumber(row, fields::kTo, kOp, i);
        requireIncreasing(from, to, kOp, i);
        assays.push_back(makeInterval(row, std::move(hole_id), from, to,
                                      assayFields(), options.keep_all));
    }

    std::stable_sort(assays.begin(), assays.end(), intervalLess);
    return assays;
}

IntervalList loadGeology(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadGeology";
    auto prepared = prepareRows(rows, options, kOp, &kGeologyCodeColumns, &kGeologyValueColumns);
    requireColumns(prepared, kOp, {fields::kFrom, fields::kTo});

    if (!tableHasColumn(prepared, fields::kGeologyCode) &&
        !tableHasColumn(prepared, fields::kGeologyDescription)) {
        throw MissingColumnError(std::string(kOp), std::string(fields::kGeologyCode) +
                                 "' или '" + fields::kGeologyDescription);
    }

    IntervalList geology;
    geology.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];
        auto hole_id = requireHoleId(row, kOp, i);
        double from = requireNumber(row, fields::kFrom, kOp, i);
        double to = requireNumber(row, fields::kTo, kOp, i);
        requireIncreasing(from, to, kOp, i);

        auto interval = makeInterval(row, std::move(hole_id), from, to,
                                     geologyFields(), options.keep_all);

        auto code = row.get(fields::kGeologyCode);
        auto description = row.get(fields::kGeologyDescription);
        if (isBlank(code) && !isBlank(description)) {
            code = description;
        } else if (isBlank(description) && !isBlank(code)) {
            description = code;
        }
        interval.extra.set(fields::kGeologyCode, code);
        interval.extra.set(fields::kGeologyDescription, description);

        geology.push_back(std::move(interval));
    }

    validateNoOverlappingIntervals(geology, "Geology");
    std::stable_sort(geology.begin(), geology.end(), intervalLess);
    return geology;
}

std::optional<StructuralSchema> detectStructuralSchema(const Table& rows) {
    bool has_from = tableHasColumn(rows, fields::kFrom);
    if (has_from && tableHasColumn(rows, fields::kTo)) {
        return StructuralSchema::Interval;
    }
    if (has_from) {
        return StructuralSchema::Point;
    }
    return std::nullopt;
}

IntervalList loadStructuralPoints(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadStructuralPoints";
    auto prepared = prepareRows(rows, options, kOp);
    requireColumns(prepared, kOp, {fields::kFrom});

    IntervalList points;
    points.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];
        auto hole_id = requireHoleId(row, kOp, i);
        double depth = requireNumber(row, fields::kFrom, kOp, i);

        auto point = makeInterval(row, std::move(hole_id), depth, depth,
                                  structuralFields(), options.keep_all);
        setStructuralFields(point, row, kOp, i);
        points.push_back(std::move(point));
    }

    std::stable_sort(points.begin(), points.end(), intervalLess);
    return points;
}

IntervalList loadStructuralIntervals(const Table& rows, const LoadOptions& options) {
    constexpr std::string_view kOp = "loadStructuralIntervals";
    auto prepared = prepareRows(rows, options, kOp);
    requireColumns(prepared, kOp, {fields::kFrom, fields::kTo});

    IntervalList intervals;
    intervals.reserve(prepared.size());

    for (size_t i = 0; i < prepared.size(); ++i) {
        const auto& row = prepared[i];
        auto hole_id = requireHoleId(row, kOp, i);
        double from = requireNumber(row, fields::kFrom, kOp, i);
        double to = requireNumber(row, fields::kTo, kOp, i);
        requireIncreasing(from, to, kOp, i);

        auto interval = makeInterval(row, std::move(hole_id), from, to,
                                     structuralFields(), options.keep_all);
        setStructuralFields(interval, row, kOp, i);
        intervals.push_back(std::move(interval));
    }

    std::stable_sort(intervals.begin(), intervals.end(), intervalLess);
    return intervals;
}

StructuralData loadStructures(const Table& rows, const LoadOptions& options) {
    auto schema = detectStructuralSchema(loadTable(rows, options));
    if (!schema) {
        throw MissingColumnError("loadStructures", fields::kFrom);
    }

    StructuralData data;
    data.schema = *schema;
    data.measurements = *schema == StructuralSchema::Interval
        ? loadStructuralIntervals(rows, options)
        : loadStructuralPoints(rows, options);
    return data;
}

Table flattenLongFormat(
    const Table& rows,
    std::string_view label,
    const std::vector<std::string>& code_candidates,
    const std::vector<std::string>& value_candidates
) {
    auto firstPresent = [&rows](const std::vector<std::string>& candidates) -> std::optional<std::string> {
        for (const auto& column : candidates) {
            if (tableHasColumn(rows, column)) {
                return column;
            }
        }
        return std::nullopt;
    };

    auto code_column = firstPresent(code_candidates);
    auto value_column = firstPresent(value_candidates);
    if (!code_column) {
        throw MissingColumnError(std::string(label), code_candidates.front());
    }
    if (!value_column) {
        throw MissingColumnError(std::string(label), value_candidates.front());
    }

    // Базовые колонки в порядке первого появления
    std::vector<std::string> base_columns;
    for (const auto& row : rows) {
        for (const auto& [name, value] : row) {
            if (name != *code_column && name != *value_column &&
                std::find(base_columns.begin(), base_columns.end(), name) == base_columns.end()) {
                base_columns.push_back(name);
            }
        }
    }
    for (const char* required : {fields::kHoleId, fields::kFrom, fields::kTo}) {
        if (std::find(base_columns.begin(), base_columns.end(), required) == base_columns.end()) {
            throw MissingColumnError(std::string(label), required);
        }
    }

    Table wide;
    std::unordered_map<std::string, size_t> index;

    for (const auto& row : rows) {
        std::string key;
        Row base;
        for (const auto& column : base_columns) {
            auto value = row.get(column);
            key += std::to_string(value.index()) + ':' + toText(value) + '\x1f';
            base.set(column, std::move(value));
        }

        auto [it, inserted] = index.emplace(key, wide.size());
        if (inserted) {
            wide.push_back(std::move(base));
        }

        auto code = trim(row.text(*code_column));
        if (!code.empty()) {
            wide[it->second].setIfAbsent(code, row.get(*value_column));
        }
    }
    return wide;
}

Table filterByProject(const Table& rows, const std::optional<std::string>& project_id) {
    if (!project_id.has_value() || !tableHasColumn(rows, fields::kProjectId)) {
        return rows;
    }
    auto wanted = trim(*project_id);

    Table filtered;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(filtered),
        [&wanted](const Row& row) { return trim(row.text(fields::kProjectId)) == wanted; });
    return filtered;
}

Dataset assembleDataset(
    const DatasetSources& sources,
    const LoadOptions& options,
    const DesurveyConfig& desurvey_config,
    const core::ProgressCallback& on_progress
) {
    Dataset dataset;
    dataset.collars = loadCollars(sources.collars, options);
    dataset.surveys = loadSurveys(sources.surveys, options);

    auto traces = desurvey(dataset.collars, dataset.surveys, desurvey_config, on_progress);
    dataset.traces = std::move(traces.points);
    dataset.skipped = std::move(traces.skipped);

    if (sources.assays) {
        dataset.assays = attachAssayPositions(loadAssays(*sources.assays, options),
                                              dataset.traces, desurvey_config.hole_id_column);
    }
    if (sources.geology) {
        dataset.geology = attachAssayPositions(loadGeology(*sources.geology, options),
                                               dataset.traces, desurvey_config.hole_id_column);
    }
    if (sources.structures) {
        dataset.structures = attachAssayPositions(loadStructures(*sources.structures, options).measurements,
                                                  dataset.traces, desurvey_config.hole_id_column);
    }
    return dataset;
}

} // namespace drilltrace::io

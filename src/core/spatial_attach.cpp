/**
 * @file spatial_attach.cpp
 * @brief Реализация привязки интервалов к траекториям
 */

#include "spatial_attach.hpp"
#include "hole_key.hpp"
#include "model/datamodel.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <unordered_map>

namespace drilltrace::core {

namespace {

void mergeField(Interval& interval, const std::string& name, CellValue value) {
    if (interval.hasField(name)) {
        interval.setField(name + kTraceSuffix, std::move(value));
    } else {
        interval.setField(name, std::move(value));
    }
}

std::string joinKey(const std::vector<std::string>& columns,
                    const std::function<CellValue(const std::string&)>& get) {
    std::string key;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            key += '|';
        }
        key += toText(get(columns[i]));
    }
    return key;
}

} // namespace

IntervalList attachAssayPositions(
    const IntervalList& intervals,
    const TraceList& traces,
    const std::optional<std::string>& hole_id_column
) {
    if (intervals.empty()) {
        return {};
    }

    auto canonical_intervals = canonicalizeHoleIds(intervals, hole_id_column, "attachAssayPositions");
    auto canonical_traces = canonicalizeHoleIds(traces, hole_id_column, "attachAssayPositions");

    std::unordered_map<std::string, std::vector<const TracePoint*>> by_hole;
    for (const auto& point : canonical_traces.items) {
        if (std::isfinite(point.md)) {
            by_hole[point.hole_id].push_back(&point);
        }
    }
    for (auto& [hole_id, points] : by_hole) {
        std::stable_sort(points.begin(), points.end(),
            [](const TracePoint* a, const TracePoint* b) { return a->md < b->md; });
    }

    IntervalList result = std::move(canonical_intervals.items);
    for (auto& interval : result) {
        interval.mid = 0.5 * (interval.from + interval.to);
        if (!std::isfinite(interval.mid)) {
            continue;
        }
        auto it = by_hole.find(interval.hole_id);
        if (it == by_hole.end() || it->second.empty()) {
            continue;
        }

        // Первый минимум по возрастанию md
        const TracePoint* nearest = nullptr;
        double best = 0.0;
        for (const auto* point : it->second) {
            double distance = std::abs(point->md - interval.mid);
            if (nearest == nullptr || distance < best) {
                nearest = point;
                best = distance;
            }
        }

        for (const auto& name : traceAttachFields()) {
            mergeField(interval, name, nearest->field(name));
        }
    }
    return result;
}

IntervalList joinAssaysToTraces(
    const IntervalList& intervals,
    const TraceList& traces,
    const std::vector<std::string>& on_columns
) {
    std::unordered_map<std::string, const TracePoint*> by_key;
    for (const auto& point : traces) {
        auto key = joinKey(on_columns, [&point](const std::string& c) { return point.field(c); });
        by_key[key] = &point;
    }

    IntervalList result = intervals;
    for (auto& interval : result) {
        auto key = joinKey(on_columns, [&interval](const std::string& c) { return interval.field(c); });
        auto it = by_key.find(key);
        if (it == by_key.end()) {
            continue;
        }
        for (const auto& name : it->second->fieldNames()) {
            if (std::find(on_columns.begin(), on_columns.end(), name) != on_columns.end()) {
                continue;
            }
            mergeField(interval, name, it->second->field(name));
        }
    }
    return result;
}

} // namespace drilltrace::core

/**
 * @file interval_validation.cpp
 * @brief Реализация проверок интервальных данных
 */

#include "interval_validation.hpp"
#include "model/data_errors.hpp"
#include "model/datamodel.hpp"
#include <algorithm>
#include <optional>
#include <unordered_map>

namespace drilltrace::core {

namespace {

struct RowRef {
    size_t index;
    std::optional<double> from;
    std::optional<double> to;
};

// Строки по скважинам в порядке первого появления
std::vector<std::pair<std::string, std::vector<RowRef>>> groupRows(const Table& rows) {
    std::vector<std::pair<std::string, std::vector<RowRef>>> groups;
    std::unordered_map<std::string, size_t> index;

    for (size_t i = 0; i < rows.size(); ++i) {
        auto hole_id = rows[i].text(fields::kHoleId);
        auto [it, inserted] = index.emplace(hole_id, groups.size());
        if (inserted) {
            groups.emplace_back(hole_id, std::vector<RowRef>{});
        }
        groups[it->second].second.push_back(
            {i, rows[i].number(fields::kFrom), rows[i].number(fields::kTo)});
    }
    return groups;
}

} // namespace

void validateNoOverlappingIntervals(const IntervalList& intervals, std::string_view label) {
    std::vector<const Interval*> sorted;
    sorted.reserve(intervals.size());
    for (const auto& interval : intervals) {
        sorted.push_back(&interval);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Interval* a, const Interval* b) {
        if (a->hole_id != b->hole_id) return a->hole_id < b->hole_id;
        if (a->from != b->from) return a->from < b->from;
        return a->to < b->to;
    });

    const std::string* current_hole = nullptr;
    double prev_to = 0.0;

    for (const auto* interval : sorted) {
        if (current_hole == nullptr || *current_hole != interval->hole_id) {
            current_hole = &interval->hole_id;
            prev_to = interval->to;
            continue;
        }
        if (interval->from < prev_to) {
            throw OverlapError(std::string(label), interval->hole_id,
                               interval->from, interval->to, prev_to);
        }
        prev_to = interval->to;
    }
}

ValidationResult validateIntervals(const Table& rows) {
    ValidationResult result;

    for (auto& [hole_id, refs] : groupRows(rows)) {
        // Строки без from уходят в конец, как при сортировке с пропусками
        std::stable_sort(refs.begin(), refs.end(), [](const RowRef& a, const RowRef& b) {
            if (!a.from.has_value()) return false;
            if (!b.from.has_value()) return true;
            return *a.from < *b.from;
        });

        std::optional<double> prev_to;
        for (const auto& ref : refs) {
            if (!ref.from.has_value() || !ref.to.has_value()) {
                result.addError(ValidationErrorType::MissingDepth, hole_id,
                    ref.from.has_value() ? fields::kTo : fields::kFrom,
                    "не заполнена глубина интервала", ref.index);
                continue;
            }
            if (*ref.to <= *ref.from) {
                result.addError(ValidationErrorType::NonPositiveLength, hole_id, fields::kTo,
                    "конец интервала не больше начала", ref.index);
            }
            if (prev_to.has_value() && *ref.from < *prev_to) {
                result.addError(ValidationErrorType::Overlap, hole_id, fields::kFrom,
                    "интервал перекрывает предыдущий", ref.index);
            }
            prev_to = ref.to;
        }
    }
    return result;
}

ValidationResult validateSurveys(const Table& rows) {
    ValidationResult result;

    for (const auto& [hole_id, refs] : groupRows(rows)) {
        std::optional<double> prev_depth;
        for (const auto& ref : refs) {
            if (!ref.from.has_value()) {
                result.addError(ValidationErrorType::MissingDepth, hole_id, fields::kFrom,
                    "не заполнена глубина станции", ref.index);
                continue;
            }
            if (prev_depth.has_value() && *ref.from < *prev_depth) {
                result.addError(ValidationErrorType::NonMonotonicDepth, hole_id, fields::kFrom,
                    "глубина станции меньше предыдущей", ref.index);
            }
            prev_depth = ref.from;
        }
    }
    return result;
}

ValidationResult validateStructuralMeasurements(const IntervalList& measurements) {
    ValidationResult result;

    for (size_t i = 0; i < measurements.size(); ++i) {
        const auto& m = measurements[i];

        if (auto dip = m.extra.number(fields::kDip); dip && (*dip < 0.0 || *dip > 90.0)) {
            result.addError(ValidationErrorType::OutOfRange, m.hole_id, fields::kDip,
                "dip " + toText(*dip) + " вне диапазона [0, 90]", i);
        }
        if (auto azimuth = m.extra.number(fields::kAzimuth);
            azimuth && (*azimuth < 0.0 || *azimuth >= 360.0)) {
            result.addError(ValidationErrorType::OutOfRange, m.hole_id, fields::kAzimuth,
                "azimuth " + toText(*azimuth) + " вне диапазона [0, 360)", i);
        }
    }
    return result;
}

std::vector<std::string> reportMissingColumns(const Table& rows,
                                              const std::vector<std::string>& required) {
    std::vector<std::string> missing;
    for (const auto& column : required) {
        if (!tableHasColumn(rows, column)) {
            missing.push_back(column);
        }
    }
    return missing;
}

} // namespace drilltrace::core

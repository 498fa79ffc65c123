/**
 * @file desurvey.cpp
 * @brief Реализация построения траекторий
 */

#include "desurvey.hpp"
#include "geo_projection.hpp"
#include "hole_key.hpp"
#include "trajectory.hpp"
#include <glm/vec3.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <unordered_map>

namespace drilltrace::core {

namespace {

/// Верхняя граница числа подшагов на интервал между станциями
constexpr double kMaxSubsteps = 100'000.0;

/**
 * @brief Состояние свёртки по подшагам одной скважины
 *
 * offset накапливается в осях {восток, север, вниз}; отметка точки
 * получается вычитанием вертикальной составляющей из отметки устья.
 */
struct TraceCursor {
    Coordinate3D collar;
    std::optional<GeoPoint> geo_origin;  ///< Устье в градусах
    glm::dvec3 offset{0.0};
    double md = 0.0;
    Orientation orientation;

    void advance(const SegmentDisplacement& d) noexcept {
        offset += glm::dvec3{d.east, d.north, d.down};
    }

    [[nodiscard]] Coordinate3D position() const noexcept {
        return {collar.x + offset.x, collar.y + offset.y, collar.z - offset.z};
    }
};

bool isValidStation(const SurveyStation& s) noexcept {
    return std::isfinite(s.from) && std::isfinite(s.azimuth) && std::isfinite(s.dip);
}

struct HoleStations {
    std::string hole_id;
    std::vector<SurveyStation> stations;
};

// Группировка в порядке первого появления скважины
std::vector<HoleStations> groupByHole(const SurveyList& surveys) {
    std::vector<HoleStations> groups;
    std::unordered_map<std::string, size_t> index;

    for (const auto& station : surveys) {
        if (station.hole_id.empty()) {
            continue;
        }
        auto [it, inserted] = index.emplace(station.hole_id, groups.size());
        if (inserted) {
            groups.push_back({station.hole_id, {}});
        }
        groups[it->second].stations.push_back(station);
    }
    return groups;
}

TracePoint makePoint(const std::string& hole_id, const TraceCursor& cursor,
                     const std::optional<std::string>& alias_column, const CellValue& alias_value) {
    TracePoint point;
    point.hole_id = hole_id;
    point.md = cursor.md;
    point.position = cursor.position();
    point.azimuth = cursor.orientation.azimuth.value;
    point.dip = cursor.orientation.dip.value;
    if (cursor.geo_origin) {
        auto geo = localToGeographic(*cursor.geo_origin, {cursor.offset.x, cursor.offset.y});
        point.latitude = geo.latitude;
        point.longitude = geo.longitude;
    }
    if (alias_column) {
        point.alias_column = alias_column;
        point.alias_value = alias_value;
    }
    return point;
}

void traceHole(const std::string& hole_id,
               const Collar& collar,
               const std::vector<SurveyStation>& sorted,
               const ISegmentCalculator& calculator,
               double step,
               const std::string& alias_column,
               TraceList& out) {
    std::optional<std::string> alias;
    CellValue alias_value;
    if (alias_column != fields::kHoleId) {
        alias_value = collar.field(alias_column);
        if (!std::holds_alternative<std::monostate>(alias_value)) {
            alias = alias_column;
        }
    }

    TraceCursor cursor;
    cursor.collar = collar.position;
    if (isGeographicCollar(collar)) {
        cursor.geo_origin = GeoPoint{*collar.latitude, *collar.longitude};
    }
    cursor.md = sorted.front().from;
    cursor.orientation = sorted.front().orientation();
    out.push_back(makePoint(hole_id, cursor, alias, alias_value));

    for (size_t i = 0; i + 1 < sorted.size(); ++i) {
        const auto& s0 = sorted[i];
        const auto& s1 = sorted[i + 1];
        double md0 = s0.from;
        double delta = s1.from - md0;
        if (delta <= 0.0) {
            continue;
        }

        // Условие с отрицанием ловит и NaN
        double raw_steps = std::ceil(delta / step);
        if (!(raw_steps <= kMaxSubsteps)) {
            raw_steps = kMaxSubsteps;
        }
        auto steps = static_cast<size_t>(std::max(1.0, raw_steps));
        Meters increment{delta / static_cast<double>(steps)};
        auto o0 = s0.orientation();
        auto o1 = s1.orientation();

        for (size_t k = 1; k <= steps; ++k) {
            double weight = static_cast<double>(k) / static_cast<double>(steps);
            cursor.advance(calculator.displacement(increment, o0, o1));
            cursor.md = k == steps ? s1.from : md0 + delta * weight;
            cursor.orientation = calculator.orientationAt(o0, o1, weight);
            out.push_back(makePoint(hole_id, cursor, alias, alias_value));
        }
    }
}

} // namespace

std::string toString(SkipReason reason) {
    switch (reason) {
        case SkipReason::NoCollar: return "no_collar";
        case SkipReason::NoValidStations: return "no_valid_stations";
    }
    return "no_collar";
}

std::optional<SkipReason> parseSkipReason(std::string_view text) {
    if (text == "no_collar") return SkipReason::NoCollar;
    if (text == "no_valid_stations") return SkipReason::NoValidStations;
    return std::nullopt;
}

double effectiveStep(double step) noexcept {
    return std::isfinite(step) && step > 0.0 ? step : 1.0;
}

DesurveyResult desurvey(
    const CollarList& collars,
    const SurveyList& surveys,
    const DesurveyConfig& config,
    const ProgressCallback& on_progress
) {
    DesurveyResult result;
    double step = effectiveStep(config.step);

    auto canonical_collars = canonicalizeHoleIds(collars, config.hole_id_column, "desurvey");
    result.alias_column = canonical_collars.alias_column;

    auto survey_column = config.hole_id_column.has_value()
        ? config.hole_id_column
        : std::optional<std::string>(canonical_collars.alias_column);
    auto canonical_surveys = canonicalizeHoleIds(surveys, survey_column, "desurvey");

    if (canonical_surveys.items.empty()) {
        return result;
    }

    // Первое устье на скважину
    std::unordered_map<std::string, const Collar*> collar_by_hole;
    for (const auto& collar : canonical_collars.items) {
        if (!collar.hole_id.empty()) {
            collar_by_hole.emplace(collar.hole_id, &collar);
        }
    }

    auto calculator = createCalculator(config.method);
    auto groups = groupByHole(canonical_surveys.items);

    for (size_t g = 0; g < groups.size(); ++g) {
        auto& group = groups[g];

        auto collar_it = collar_by_hole.find(group.hole_id);
        if (collar_it == collar_by_hole.end()) {
            result.skipped.push_back({group.hole_id, SkipReason::NoCollar});
        } else {
            std::vector<SurveyStation> valid;
            std::copy_if(group.stations.begin(), group.stations.end(),
                         std::back_inserter(valid), isValidStation);
            std::stable_sort(valid.begin(), valid.end(),
                [](const SurveyStation& a, const SurveyStation& b) {
                    return a.from < b.from;
                });

            if (valid.empty()) {
                result.skipped.push_back({group.hole_id, SkipReason::NoValidStations});
            } else {
                traceHole(group.hole_id, *collar_it->second, valid, *calculator,
                          step, canonical_collars.alias_column, result.points);
            }
        }

        if (on_progress) {
            on_progress(static_cast<double>(g + 1) / static_cast<double>(groups.size()),
                        group.hole_id);
        }
    }

    return result;
}

namespace {

DesurveyResult desurveyWith(DesurveyMethod method,
                            const CollarList& collars, const SurveyList& surveys,
                            double step, const std::optional<std::string>& hole_id_column) {
    DesurveyConfig config;
    config.step = step;
    config.method = method;
    config.hole_id_column = hole_id_column;
    return desurvey(collars, surveys, config);
}

} // namespace

DesurveyResult minimumCurvatureDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step, const std::optional<std::string>& hole_id_column) {
    return desurveyWith(DesurveyMethod::MinimumCurvature, collars, surveys, step, hole_id_column);
}

DesurveyResult tangentialDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step, const std::optional<std::string>& hole_id_column) {
    return desurveyWith(DesurveyMethod::Tangential, collars, surveys, step, hole_id_column);
}

DesurveyResult balancedTangentialDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step, const std::optional<std::string>& hole_id_column) {
    return desurveyWith(DesurveyMethod::BalancedTangential, collars, surveys, step, hole_id_column);
}

DesurveyResult buildTraces(
    const CollarList& collars, const SurveyList& surveys,
    double step, const std::optional<std::string>& hole_id_column) {
    return minimumCurvatureDesurvey(collars, surveys, step, hole_id_column);
}

} // namespace drilltrace::core

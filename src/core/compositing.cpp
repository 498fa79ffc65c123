/**
 * @file compositing.cpp
 * @brief Реализация композитирования и передискретизации
 */

#include "compositing.hpp"
#include "angle_utils.hpp"
#include "model/data_errors.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace drilltrace::core {

namespace {

constexpr double kDepthTolerance = 1e-9;

template <typename Item>
std::vector<std::vector<const Item*>> groupByHole(const std::vector<Item>& items) {
    std::vector<std::vector<const Item*>> groups;
    std::unordered_map<std::string, size_t> index;
    for (const auto& item : items) {
        auto [it, inserted] = index.emplace(item.hole_id, groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(&item);
    }
    return groups;
}

} // namespace

IntervalList compositeIntervals(
    const IntervalList& intervals,
    const std::string& value_column,
    Meters length,
    CompositeMethod method
) {
    if (!std::isfinite(length.value) || length.value <= 0.0) {
        throw InvalidValueError("compositeIntervals", "длина композита должна быть положительной");
    }

    IntervalList result;
    for (auto& group : groupByHole(intervals)) {
        std::stable_sort(group.begin(), group.end(),
            [](const Interval* a, const Interval* b) { return a->from < b->from; });

        double start = group.front()->from;
        double end = group.front()->to;
        for (const auto* interval : group) {
            start = std::min(start, interval->from);
            end = std::max(end, interval->to);
        }

        for (size_t k = 0;; ++k) {
            double c_from = start + static_cast<double>(k) * length.value;
            if (c_from >= end - kDepthTolerance) {
                break;
            }
            double c_to = c_from + length.value;

            double weighted = 0.0;
            double total_overlap = 0.0;
            for (const auto* interval : group) {
                if (!(interval->from < c_to && interval->to > c_from)) {
                    continue;
                }
                auto value = toNumber(interval->field(value_column));
                if (!value.has_value()) {
                    continue;
                }
                double overlap = std::min(interval->to, c_to) - std::max(interval->from, c_from);
                if (overlap <= 0.0) {
                    continue;
                }
                weighted += *value * overlap;
                total_overlap += overlap;
            }
            if (total_overlap <= 0.0) {
                continue;
            }

            Interval composite;
            composite.hole_id = group.front()->hole_id;
            composite.from = c_from;
            composite.to = c_to;
            composite.mid = 0.5 * (c_from + c_to);
            double value = method == CompositeMethod::Sum ? weighted : weighted / total_overlap;
            composite.extra.set(value_column, value);
            result.push_back(std::move(composite));
        }
    }
    return result;
}

TraceList resampleTrace(const TraceList& points, Meters step) {
    if (!std::isfinite(step.value) || step.value <= 0.0) {
        throw InvalidValueError("resampleTrace", "шаг должен быть положительным");
    }

    TraceList result;
    for (auto& group : groupByHole(points)) {
        std::stable_sort(group.begin(), group.end(),
            [](const TracePoint* a, const TracePoint* b) { return a->md < b->md; });

        double start = group.front()->md;
        double end = group.back()->md;
        size_t segment = 0;

        for (size_t k = 0;; ++k) {
            double md = start + static_cast<double>(k) * step.value;
            if (md > end + kDepthTolerance) {
                break;
            }
            while (segment + 1 < group.size() - 1 && group[segment + 1]->md < md) {
                ++segment;
            }

            const TracePoint* a = group[segment];
            const TracePoint* b = group.size() > 1 ? group[segment + 1] : a;

            TracePoint sample = *a;
            sample.md = md;
            sample.position.x = interpolate(md, a->position.x, a->md, b->position.x, b->md);
            sample.position.y = interpolate(md, a->position.y, a->md, b->position.y, b->md);
            sample.position.z = interpolate(md, a->position.z, a->md, b->position.z, b->md);
            sample.azimuth = interpolate(md, a->azimuth, a->md, b->azimuth, b->md);
            sample.dip = interpolate(md, a->dip, a->md, b->dip, b->md);
            result.push_back(std::move(sample));
        }
    }
    return result;
}

} // namespace drilltrace::core

/**
 * @file types.cpp
 * @brief Реализация базовых типов
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace drilltrace::model {

std::string toString(DesurveyMethod method) {
    switch (method) {
        case DesurveyMethod::Tangential: return "tangential";
        case DesurveyMethod::BalancedTangential: return "balanced_tangential";
        case DesurveyMethod::MinimumCurvature: return "minimum_curvature";
    }
    return "minimum_curvature";
}

std::optional<DesurveyMethod> parseDesurveyMethod(std::string_view str) {
    std::string lowered(str);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lowered.begin(), lowered.end(), '-', '_');

    if (lowered == "tangential") return DesurveyMethod::Tangential;
    if (lowered == "balanced_tangential") return DesurveyMethod::BalancedTangential;
    if (lowered == "minimum_curvature") return DesurveyMethod::MinimumCurvature;
    return std::nullopt;
}

std::string methodDisplayName(DesurveyMethod method) {
    switch (method) {
        case DesurveyMethod::Tangential: return "Тангенциальный";
        case DesurveyMethod::BalancedTangential: return "Балансный тангенциальный";
        case DesurveyMethod::MinimumCurvature: return "Минимальная кривизна";
    }
    return "Минимальная кривизна";
}

} // namespace drilltrace::model

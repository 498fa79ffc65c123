/**
 * @file desurvey.hpp
 * @brief Построение 3D траекторий скважин по данным инклинометрии
 *
 * Для каждой скважины с устьем и хотя бы одной корректной станцией
 * строится упорядоченный по глубине список точек: первая точка в устье,
 * далее подшаги длиной не более step между соседними станциями.
 */

#pragma once

#include "model/records.hpp"
#include "model/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Причина пропуска скважины
 */
enum class SkipReason {
    NoCollar,          ///< Нет устья с таким hole_id
    NoValidStations    ///< Нет станций с конечными from/azimuth/dip
};

[[nodiscard]] std::string toString(SkipReason reason);
[[nodiscard]] std::optional<SkipReason> parseSkipReason(std::string_view text);

/**
 * @brief Пропущенная скважина
 */
struct SkippedHole {
    std::string hole_id;
    SkipReason reason;
};

/**
 * @brief Результат построения траекторий
 */
struct DesurveyResult {
    TraceList points;                   ///< Точки всех скважин, внутри скважины по возрастанию md
    std::vector<SkippedHole> skipped;   ///< Скважины без траектории
    std::string alias_column;           ///< Колонка идентификатора устьев
};

/**
 * @brief Callback для отслеживания прогресса (доля [0, 1], hole_id)
 */
using ProgressCallback = std::function<void(double progress, std::string_view message)>;

/**
 * @brief Фактический шаг: некорректный или неположительный заменяется на 1
 */
[[nodiscard]] double effectiveStep(double step) noexcept;

/**
 * @brief Построение траекторий
 *
 * Устья канонизируются по config.hole_id_column, станции — по той же
 * колонке либо по колонке, выбранной для устьев. Скважины без устья
 * или без корректных станций пропускаются без исключения.
 * Число подшагов между двумя станциями не превышает 100 000.
 * Для устьев, заданных широтой/долготой, точки получают latitude/longitude.
 *
 * @param collars Устья
 * @param surveys Станции инклинометрии (в любом порядке)
 * @param config Шаг, метод, колонка идентификатора
 * @param on_progress Вызывается после каждой обработанной скважины
 * @throws HoleIdResolutionError если идентификатор не найден ни в одной колонке
 */
[[nodiscard]] DesurveyResult desurvey(
    const CollarList& collars,
    const SurveyList& surveys,
    const DesurveyConfig& config = {},
    const ProgressCallback& on_progress = nullptr
);

[[nodiscard]] DesurveyResult minimumCurvatureDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step = 1.0, const std::optional<std::string>& hole_id_column = std::nullopt);

[[nodiscard]] DesurveyResult tangentialDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step = 1.0, const std::optional<std::string>& hole_id_column = std::nullopt);

[[nodiscard]] DesurveyResult balancedTangentialDesurvey(
    const CollarList& collars, const SurveyList& surveys,
    double step = 1.0, const std::optional<std::string>& hole_id_column = std::nullopt);

/**
 * @brief Траектории методом минимальной кривизны
 */
[[nodiscard]] DesurveyResult buildTraces(
    const CollarList& collars, const SurveyList& surveys,
    double step = 1.0, const std::optional<std::string>& hole_id_column = std::nullopt);

} // namespace drilltrace::core

/**
 * @file loaders.hpp
 * @brief Загрузка таблиц устьев, инклинометрии, опробования, геологии
 * и структурных замеров
 *
 * Каждый загрузчик стандартизует колонки, проверяет наличие
 * обязательных колонок и корректность каждой строки и возвращает
 * типизированные записи. Загрузка атомарна: одна некорректная строка
 * отклоняет всю таблицу.
 */

#pragma once

#include "core/column_standardizer.hpp"
#include "core/desurvey.hpp"
#include "model/records.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::io {

using namespace drilltrace::model;

/**
 * @brief Опции загрузки
 */
struct LoadOptions {
    core::ColumnOverrides column_overrides;     ///< Исходное имя → каноническое
    std::optional<std::string> hole_id_column;  ///< Колонка-источник hole_id
    bool keep_all = true;                       ///< false: только поля схемы
    bool flat = true;                           ///< false: длинный формат (код/значение)
};

/**
 * @brief Стандартизация таблицы без проверки схемы
 */
[[nodiscard]] Table loadTable(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Загрузка устьев
 *
 * Нужны hole_id и пара easting/northing или latitude/longitude.
 * Положение: x/y из easting/northing; устья только с широтой/долготой
 * размещаются в метрах относительно первого такого устья
 * (projectGeographicCollars). z из elevation (0 при отсутствии).
 * Порядок строк сохраняется.
 *
 * @throws MissingColumnError, InvalidValueError
 */
[[nodiscard]] CollarList loadCollars(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Загрузка станций инклинометрии
 *
 * Нужны hole_id, from (глубина), azimuth, dip. Результат упорядочен
 * по (hole_id, from).
 */
[[nodiscard]] SurveyList loadSurveys(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Загрузка интервалов опробования
 *
 * Нужны hole_id, from, to, в каждой строке to > from. Вычисляется mid.
 * Результат упорядочен по (hole_id, from, to).
 */
[[nodiscard]] IntervalList loadAssays(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Загрузка геологических интервалов
 *
 * Как loadAssays: в каждой строке конечные from/to и to > from.
 * Нужна хотя бы одна из колонок geology_code / geology_description,
 * недостающее значение заполняется из второй.
 * Перекрытия интервалов внутри скважины недопустимы.
 *
 * @throws OverlapError при перекрытии
 */
[[nodiscard]] IntervalList loadGeology(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Схема таблицы структурных замеров
 */
enum class StructuralSchema {
    Point,     ///< Замер на глубине (depth, после стандартизации from)
    Interval   ///< Интервал from/to
};

/**
 * @brief Определение схемы по стандартизованным колонкам
 *
 * Есть from и to: интервалы; только from: точки; иначе nullopt.
 */
[[nodiscard]] std::optional<StructuralSchema> detectStructuralSchema(const Table& rows);

/**
 * @brief Точечные структурные замеры
 *
 * Нужны hole_id и глубина замера. Замер хранится как интервал нулевой
 * длины: from = to = mid = глубина. dip и azimuth необязательны, но
 * если заполнены, должны быть числами; structure_type переносится
 * как текст. Диапазоны углов проверяет validateStructuralMeasurements.
 */
[[nodiscard]] IntervalList loadStructuralPoints(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Интервальные структурные замеры
 *
 * Нужны hole_id, from, to, в каждой строке to > from.
 */
[[nodiscard]] IntervalList loadStructuralIntervals(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Структурные замеры с определением схемы
 */
struct StructuralData {
    StructuralSchema schema = StructuralSchema::Point;
    IntervalList measurements;
};

/**
 * @throws MissingColumnError если нет ни глубины, ни пары from/to
 */
[[nodiscard]] StructuralData loadStructures(const Table& rows, const LoadOptions& options = {});

/**
 * @brief Разворот длинного формата (строка на код) в широкий
 *
 * Строки с одинаковыми значениями остальных колонок сливаются, каждый
 * код становится колонкой, при повторе берётся первое значение.
 *
 * @param label Название таблицы для сообщений
 * @param code_candidates Возможные имена колонки кода
 * @param value_candidates Возможные имена колонки значения
 */
[[nodiscard]] Table flattenLongFormat(
    const Table& rows,
    std::string_view label,
    const std::vector<std::string>& code_candidates,
    const std::vector<std::string>& value_candidates
);

/**
 * @brief Строки заданного проекта
 *
 * Без project_id или без такой колонки таблица возвращается целиком.
 */
[[nodiscard]] Table filterByProject(const Table& rows, const std::optional<std::string>& project_id);

/**
 * @brief Полный набор данных по скважинам
 */
struct Dataset {
    CollarList collars;
    SurveyList surveys;
    IntervalList assays;
    IntervalList geology;
    IntervalList structures;
    TraceList traces;
    std::vector<core::SkippedHole> skipped;
};

/**
 * @brief Исходные таблицы набора данных
 */
struct DatasetSources {
    Table collars;
    Table surveys;
    std::optional<Table> assays;
    std::optional<Table> geology;
    std::optional<Table> structures;
};

/**
 * @brief Загрузка всех таблиц, построение траекторий и привязка интервалов
 */
[[nodiscard]] Dataset assembleDataset(
    const DatasetSources& sources,
    const LoadOptions& options,
    const DesurveyConfig& desurvey_config,
    const core::ProgressCallback& on_progress = nullptr
);

} // namespace drilltrace::io

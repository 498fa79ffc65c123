/**
 * @file hole_key.hpp
 * @brief Определение колонки идентификатора скважины
 *
 * Идентификатор скважины может приходить в разных колонках (hole_id,
 * holeId, id, collar_id...). Колонка выбирается один раз на весь набор
 * данных: первый кандидат, у которого хотя бы в одной строке есть
 * непустое значение. Его значение записывается в hole_id каждой строки.
 */

#pragma once

#include "model/data_errors.hpp"
#include "model/datamodel.hpp"
#include "model/records.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drilltrace::core {

using namespace drilltrace::model;

/**
 * @brief Нормализация значения идентификатора
 *
 * Пусто → "", число → текст без хвостовых нулей, текст → обрезанный.
 */
[[nodiscard]] std::string normalizeHoleIdValue(const CellValue& value);

/**
 * @brief Упорядоченный список колонок-кандидатов без повторов
 *
 * [preferred, hole_id, holeId, id, primary_id]
 */
[[nodiscard]] std::vector<std::string> holeIdCandidates(
    const std::optional<std::string>& preferred = std::nullopt);

namespace detail {

inline CellValue cellOf(const Row& row, std::string_view name) {
    return row.get(name);
}

template <typename Record>
CellValue cellOf(const Record& record, std::string_view name) {
    return record.field(name);
}

inline void assignHoleId(Row& row, std::string value) {
    row.set(fields::kHoleId, std::move(value));
}

template <typename Record>
void assignHoleId(Record& record, std::string value) {
    record.hole_id = std::move(value);
}

} // namespace detail

/**
 * @brief Выбор колонки идентификатора для набора строк или записей
 *
 * Пустой набор разрешается в preferred (или hole_id) без ошибки.
 *
 * @throws HoleIdResolutionError если ни один кандидат не подходит
 */
template <typename Item>
[[nodiscard]] std::string resolveHoleIdColumn(
    const std::vector<Item>& items,
    const std::optional<std::string>& preferred = std::nullopt,
    std::string_view operation = "canonicalizeHoleIds"
) {
    auto candidates = holeIdCandidates(preferred);
    if (items.empty()) {
        return candidates.front();
    }

    for (const auto& column : candidates) {
        for (const auto& item : items) {
            if (!normalizeHoleIdValue(detail::cellOf(item, column)).empty()) {
                return column;
            }
        }
    }
    throw HoleIdResolutionError(std::string(operation), std::move(candidates));
}

/**
 * @brief Результат канонизации
 */
template <typename Item>
struct Canonicalized {
    std::string alias_column;  ///< Колонка, давшая hole_id
    std::vector<Item> items;
};

/**
 * @brief Запись hole_id во все элементы из выбранной колонки
 *
 * Повторное применение даёт те же значения hole_id.
 */
template <typename Item>
[[nodiscard]] Canonicalized<Item> canonicalizeHoleIds(
    std::vector<Item> items,
    const std::optional<std::string>& preferred = std::nullopt,
    std::string_view operation = "canonicalizeHoleIds"
) {
    Canonicalized<Item> result;
    result.alias_column = resolveHoleIdColumn(items, preferred, operation);
    for (auto& item : items) {
        auto id = normalizeHoleIdValue(detail::cellOf(item, result.alias_column));
        detail::assignHoleId(item, std::move(id));
    }
    result.items = std::move(items);
    return result;
}

/**
 * @brief Канонизация строк таблицы
 */
[[nodiscard]] Canonicalized<Row> canonicalizeHoleIdRows(
    Table rows,
    const std::optional<std::string>& preferred = std::nullopt);

// === Первичный ключ ===

/**
 * @brief Вид первичного ключа скважины
 */
enum class PrimaryKeyKind {
    CompanyHoleId,
    HoleId,
    CollarId,
    Anumber,
    Custom
};

/**
 * @brief Настройка первичного ключа
 */
struct PrimaryKeyConfig {
    PrimaryKeyKind kind = PrimaryKeyKind::CompanyHoleId;
    std::string custom_key;  ///< Имя колонки для PrimaryKeyKind::Custom
};

[[nodiscard]] std::string toString(PrimaryKeyKind kind);
[[nodiscard]] std::optional<PrimaryKeyKind> parsePrimaryKeyKind(std::string_view str);

/**
 * @brief Нормализованное имя колонки первичного ключа
 *
 * Пустой custom_key даёт companyholeid.
 */
[[nodiscard]] std::string primaryFieldFromConfig(const PrimaryKeyConfig& config);

/**
 * @brief Первичный ключ строки
 *
 * Имена колонок сравниваются после normalizeFieldName. Просматриваются
 * primary_field и затем стандартные колонки идентификаторов.
 * @return Пустая строка, если ни одна колонка не заполнена
 */
[[nodiscard]] std::string resolvePrimaryId(const Row& row, std::string_view primary_field);

/**
 * @brief Запись колонки primary_id во все строки
 */
[[nodiscard]] Table assignPrimaryIds(Table rows, const PrimaryKeyConfig& config);

} // namespace drilltrace::core

/**
 * @file row.hpp
 * @brief Строка табличных данных с сохранением порядка колонок
 *
 * Значение ячейки: пусто, число или текст. Строка хранит пары
 * (имя колонки, значение) в порядке вставки, имя встречается не более
 * одного раза.
 */

#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace drilltrace::model {

/**
 * @brief Значение ячейки
 */
using CellValue = std::variant<std::monostate, double, std::string>;

/**
 * @brief Пустое значение: отсутствует, пустая строка или нечисло
 */
[[nodiscard]] bool isBlank(const CellValue& value) noexcept;

/**
 * @brief Числовое значение ячейки
 *
 * Текст обрезается и разбирается целиком. Бесконечности и NaN
 * считаются отсутствием числа.
 */
[[nodiscard]] std::optional<double> toNumber(const CellValue& value);

/**
 * @brief Текстовое представление ячейки
 *
 * Числа выводятся без хвостовых нулей (10 → "10", 2.5 → "2.5").
 */
[[nodiscard]] std::string toText(const CellValue& value);

/**
 * @brief Строка таблицы
 */
class Row {
public:
    using Entry = std::pair<std::string, CellValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Row() = default;
    Row(std::initializer_list<Entry> entries);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /**
     * @brief Указатель на значение или nullptr при отсутствии колонки
     */
    [[nodiscard]] const CellValue* find(std::string_view name) const noexcept;

    /**
     * @brief Значение колонки (пусто, если колонки нет)
     */
    [[nodiscard]] CellValue get(std::string_view name) const;

    [[nodiscard]] std::optional<double> number(std::string_view name) const;
    [[nodiscard]] std::string text(std::string_view name) const;

    /**
     * @brief Есть ли в колонке непустое значение
     */
    [[nodiscard]] bool hasValue(std::string_view name) const noexcept;

    /**
     * @brief Запись значения: замена на месте или добавление в конец
     */
    void set(std::string name, CellValue value);

    /**
     * @brief Добавление колонки, только если её ещё нет
     * @return true если значение записано
     */
    bool setIfAbsent(std::string name, CellValue value);

    bool erase(std::string_view name);

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const Row&) const = default;

private:
    std::vector<Entry> entries_;
};

/**
 * @brief Таблица: список строк
 */
using Table = std::vector<Row>;

/**
 * @brief Присутствует ли колонка хотя бы в одной строке
 */
[[nodiscard]] bool tableHasColumn(const Table& table, std::string_view name) noexcept;

} // namespace drilltrace::model

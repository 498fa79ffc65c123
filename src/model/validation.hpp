/**
 * @file validation.hpp
 * @brief Результаты проверки качества данных скважин
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace drilltrace::model {

/**
 * @brief Тип замечания
 */
enum class ValidationErrorType {
    MissingColumn,       ///< Отсутствует обязательная колонка
    MissingDepth,        ///< Нет from или to
    NonPositiveLength,   ///< to <= from
    Overlap,             ///< Интервал перекрывает предыдущий
    NonMonotonicDepth,   ///< Глубины станций убывают
    OutOfRange,          ///< Угол вне допустимого диапазона
    InvalidValue         ///< Некорректное значение
};

/**
 * @brief Замечание проверки
 */
struct ValidationError {
    ValidationErrorType type;
    std::string hole_id;
    std::string field;                ///< Имя поля с ошибкой
    std::string message;
    std::optional<size_t> row_index;  ///< Индекс строки во входных данных

    [[nodiscard]] std::string toString() const {
        std::string prefix;
        if (!hole_id.empty()) {
            prefix = hole_id + ": ";
        }
        if (row_index.has_value()) {
            prefix += "строка " + std::to_string(*row_index + 1) + ": ";
        }
        return prefix + message;
    }
};

/**
 * @brief Результат проверки
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;  ///< Некритичные замечания

    void addError(ValidationErrorType type, const std::string& hole_id,
                  const std::string& field, const std::string& message,
                  std::optional<size_t> row_index = std::nullopt) {
        is_valid = false;
        errors.push_back({type, hole_id, field, message, row_index});
    }

    void addWarning(const std::string& message) {
        warnings.push_back(message);
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool hasWarnings() const noexcept { return !warnings.empty(); }

    [[nodiscard]] size_t count(ValidationErrorType type) const noexcept {
        size_t n = 0;
        for (const auto& err : errors) {
            if (err.type == type) {
                ++n;
            }
        }
        return n;
    }
};

} // namespace drilltrace::model

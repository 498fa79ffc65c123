/**
 * @file data_errors.hpp
 * @brief Исключения загрузки и обработки данных скважин
 *
 * Все ошибки наследуют DataError и несут имя операции, в которой
 * возникли. Текст сообщения имеет вид "операция: описание".
 */

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace drilltrace::model {

/**
 * @brief Базовая ошибка данных
 */
class DataError : public std::runtime_error {
public:
    DataError(std::string operation, const std::string& message)
        : std::runtime_error(operation.empty() ? message : operation + ": " + message)
        , operation_(std::move(operation)) {}

    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief Отсутствует обязательная колонка
 */
class MissingColumnError : public DataError {
public:
    MissingColumnError(std::string operation, std::string column)
        : DataError(std::move(operation), "отсутствует обязательная колонка '" + column + "'")
        , column_(std::move(column)) {}

    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

/**
 * @brief Некорректное значение в строке
 */
class InvalidValueError : public DataError {
public:
    InvalidValueError(std::string operation, const std::string& message,
                      std::optional<size_t> row = std::nullopt)
        : DataError(std::move(operation),
                    row ? "строка " + std::to_string(*row + 1) + ": " + message : message)
        , row_(row) {}

    /// Индекс строки во входных данных (с нуля)
    [[nodiscard]] std::optional<size_t> row() const noexcept { return row_; }

private:
    std::optional<size_t> row_;
};

/**
 * @brief Ни одна колонка-кандидат не даёт идентификатор скважины
 */
class HoleIdResolutionError : public DataError {
public:
    HoleIdResolutionError(std::string operation, std::vector<std::string> candidates)
        : DataError(std::move(operation), describe(candidates))
        , candidates_(std::move(candidates)) {}

    [[nodiscard]] const std::vector<std::string>& candidates() const noexcept {
        return candidates_;
    }

private:
    static std::string describe(const std::vector<std::string>& candidates) {
        std::string list;
        for (const auto& name : candidates) {
            if (!list.empty()) {
                list += ", ";
            }
            list += name;
        }
        return "не найдена колонка идентификатора скважины (проверены: " + list + ")";
    }

    std::vector<std::string> candidates_;
};

/**
 * @brief Перекрывающиеся интервалы в пределах одной скважины
 */
class OverlapError : public DataError {
public:
    OverlapError(std::string operation, std::string hole_id,
                 double from, double to, double previous_to)
        : DataError(std::move(operation),
                    "перекрытие интервалов в скважине " + hole_id + ": " +
                    formatDepth(from) + "-" + formatDepth(to) +
                    " начинается выше конца предыдущего интервала " + formatDepth(previous_to))
        , hole_id_(std::move(hole_id))
        , from_(from)
        , to_(to)
        , previous_to_(previous_to) {}

    [[nodiscard]] const std::string& holeId() const noexcept { return hole_id_; }
    [[nodiscard]] double from() const noexcept { return from_; }
    [[nodiscard]] double to() const noexcept { return to_; }
    [[nodiscard]] double previousTo() const noexcept { return previous_to_; }

private:
    static std::string formatDepth(double value);

    std::string hole_id_;
    double from_;
    double to_;
    double previous_to_;
};

/**
 * @brief Ошибка с контекстом операции и исходной причиной
 */
class ContextWrappedError : public DataError {
public:
    ContextWrappedError(std::string operation, const std::string& message,
                        std::exception_ptr cause)
        : DataError(std::move(operation), message)
        , cause_(std::move(cause)) {}

    [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

/**
 * @brief Выполнение функции с добавлением контекста к ошибкам
 *
 * DataError пробрасывается как есть, прочие std::exception
 * оборачиваются в ContextWrappedError с сохранением причины.
 */
template <typename Fn>
auto withDataErrorContext(std::string_view operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const DataError&) {
        throw;
    } catch (const std::exception& e) {
        throw ContextWrappedError(std::string(operation), e.what(), std::current_exception());
    }
}

} // namespace drilltrace::model

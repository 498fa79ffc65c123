/**
 * @file text_utils.hpp
 * @brief Утилиты для нормализации UTF-8 строк (ASCII + кириллица)
 */

#pragma once

#include <string>
#include <string_view>

namespace drilltrace::model {

/**
 * @brief Удаление пробельных символов по краям
 */
[[nodiscard]] std::string trim(std::string_view str);

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string_view stripBom(std::string_view str) noexcept;

/**
 * @brief Перевод строки в нижний регистр (ASCII + базовая кириллица)
 *
 * Некорректные последовательности копируются побайтно.
 */
[[nodiscard]] std::string utf8ToLower(std::string_view input);

} // namespace drilltrace::model

/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace drilltrace::io {

/**
 * @brief Чтение файла целиком
 * @throws std::runtime_error если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace drilltrace::io

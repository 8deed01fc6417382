/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace conic::io {

/**
 * @brief Чтение файла целиком
 * @throws model::IoError Если файл не удаётся открыть или прочитать
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename)
 *
 * При ошибке целевой файл остаётся прежним, временный удаляется.
 *
 * @throws model::IoError При ошибке записи
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace conic::io

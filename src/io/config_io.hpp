/**
 * @file config_io.hpp
 * @brief Чтение и запись конфигурации обработки (JSON)
 */

#pragma once

#include "model/config.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace conic::io {

using namespace conic::model;

/**
 * @brief Разбор конфигурации из JSON текста
 *
 * Все ключи необязательны, отсутствующие сохраняют значения по умолчанию.
 * Проверка допустимости значений не выполняется (см. validateConfig).
 *
 * @throws ConfigError При ошибке синтаксиса JSON, неверном типе значения,
 *         неизвестной колонке или режиме очистки
 */
[[nodiscard]] ConicConfig configFromJson(std::string_view text);

/**
 * @brief Сериализация конфигурации в JSON
 */
[[nodiscard]] std::string configToJson(const ConicConfig& config, int indent = 2);

/**
 * @brief Загрузка и проверка конфигурации из файла
 *
 * @throws IoError Если файл не удаётся прочитать
 * @throws ConfigError При ошибке разбора или проверки (все нарушения в тексте)
 */
[[nodiscard]] ConicConfig loadConfig(const std::filesystem::path& path);

/**
 * @brief Сохранение конфигурации (атомарная запись)
 *
 * @throws IoError При ошибке записи
 */
void saveConfig(const ConicConfig& config, const std::filesystem::path& path);

/**
 * @brief Разбор разделителя CSV из строки ("," ";" "|" "\t" или "tab")
 * @throws ConfigError Для строки другой длины
 */
[[nodiscard]] char parseDelimiter(std::string_view text);

} // namespace conic::io

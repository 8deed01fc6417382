/**
 * @file csv_writer.hpp
 * @brief Экспорт таблицы зондирования в CSV и текстовый предпросмотр
 */

#pragma once

#include "model/config.hpp"
#include "model/sounding_table.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace conic::io {

using namespace conic::model;

/**
 * @brief Опции экспорта в CSV
 */
struct CsvExportOptions {
    char delimiter = ',';              ///< Разделитель полей
    char decimal_separator = '.';      ///< Десятичный разделитель
    bool include_header = true;        ///< Включить заголовок
    int decimal_places = 6;            ///< Знаков после запятой
};

/**
 * @brief Форматирование числа для CSV
 *
 * NaN - пустая ячейка, бесконечность - "inf" / "-inf".
 */
[[nodiscard]] std::string formatValue(double value, int precision, char decimal_sep);

/**
 * @brief Текстовое представление признака сходимости для CSV
 *
 * NotApplicable записывается пустой ячейкой.
 */
[[nodiscard]] std::string formatConvergence(ConvergenceState state);

/**
 * @brief Сформировать CSV текст
 *
 * Колонки в порядке создания, заголовки - отображаемые имена.
 */
[[nodiscard]] std::string formatSoundingCsv(
    const SoundingTable& table,
    const ColumnNames& names,
    const CsvExportOptions& options = {}
);

/**
 * @brief Экспорт таблицы в CSV (атомарная запись)
 *
 * @throws IoError При ошибке записи
 */
void writeSoundingCsv(
    const SoundingTable& table,
    const ColumnNames& names,
    const std::filesystem::path& path,
    const CsvExportOptions& options = {}
);

/**
 * @brief Текстовый предпросмотр первых строк таблицы (выровненные колонки)
 */
[[nodiscard]] std::string formatPreview(
    const SoundingTable& table,
    const ColumnNames& names,
    size_t rows = 8
);

} // namespace conic::io

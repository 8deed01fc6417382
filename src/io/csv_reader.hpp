/**
 * @file csv_reader.hpp
 * @brief Импорт данных зондирования из CSV файлов
 */

#pragma once

#include "model/config.hpp"
#include "model/sounding_table.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conic::io {

using namespace conic::model;

/**
 * @brief Опции чтения CSV
 */
struct CsvReadOptions {
    std::optional<char> delimiter;     ///< nullopt - автоопределение
    size_t detection_lines = 50;       ///< Строк для автоопределения разделителя
};

/**
 * @brief Определение разделителя по первым строкам файла
 *
 * Кандидаты: ';', ',', '\t', '|'. Выбирается первый, встречающийся
 * одинаковое число раз во всех строках, иначе - самый частый.
 */
[[nodiscard]] char detectDelimiter(const std::vector<std::string>& lines);

/**
 * @brief Разбор числовой ячейки
 *
 * Пустая ячейка - пропуск (NaN).
 *
 * @return nullopt если ячейка не является числом целиком
 */
[[nodiscard]] std::optional<double> parseCell(std::string_view cell);

/**
 * @brief Разбор текста CSV в таблицу зондирования
 *
 * Обязательные колонки: depth, qc, fs, u2 (по именам из names).
 * Если u0 нет, оно рассчитывается по глубине и уровню грунтовых вод.
 * Заголовок сопоставляется сначала точно, затем по нормализованному имени.
 * Лишние колонки игнорируются.
 *
 * @throws SchemaError Со списком всех отсутствующих обязательных колонок
 * @throws ParseError При нечисловой ячейке, короткой строке, отсутствии заголовка
 */
[[nodiscard]] SoundingTable parseSoundingCsv(
    std::string_view text,
    const CsvReadOptions& options,
    const ColumnNames& names,
    const HydrostaticSettings& hydrostatic
);

/**
 * @brief Чтение CSV файла с данными зондирования
 *
 * @throws IoError Если файл не удаётся прочитать
 * @throws SchemaError, ParseError См. parseSoundingCsv
 */
[[nodiscard]] SoundingTable readSoundingCsv(
    const std::filesystem::path& path,
    const CsvReadOptions& options,
    const ColumnNames& names,
    const HydrostaticSettings& hydrostatic
);

} // namespace conic::io

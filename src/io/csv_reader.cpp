/**
 * @file csv_reader.cpp
 * @brief Реализация импорта CSV
 */

#include "csv_reader.hpp"
#include "file_utils.hpp"
#include "text_utils.hpp"
#include "core/stress.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace conic::io {

namespace {

struct TextLine {
    size_t number;          ///< Номер строки в файле (с 1)
    std::string_view text;
};

/**
 * @brief Непустые строки текста (без '\r' на конце)
 */
std::vector<TextLine> splitLines(std::string_view text) {
    std::vector<TextLine> lines;
    size_t number = 0;
    size_t pos = 0;

    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        ++number;

        auto line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!trimView(line).empty()) {
            lines.push_back({number, line});
        }

        if (end == text.size()) break;
        pos = end + 1;
    }
    return lines;
}

/**
 * @brief Поиск колонки в заголовке: сначала точное имя, затем нормализованное
 */
std::optional<size_t> findHeaderColumn(
    const std::vector<std::string>& header,
    const std::string& name
) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }

    const auto wanted = normalizeColumnName(name);
    if (wanted.empty()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < header.size(); ++i) {
        if (normalizeColumnName(header[i]) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace

char detectDelimiter(const std::vector<std::string>& lines) {
    constexpr std::array<char, 4> candidates = {';', ',', '\t', '|'};
    std::array<int, 4> counts = {0, 0, 0, 0};

    for (const auto& line : lines) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            counts[i] += static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
        }
    }

    // Консистентность: одинаковое количество в каждой строке
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (counts[i] == 0) continue;

        int expected_count = -1;
        bool consistent = true;
        for (const auto& line : lines) {
            const int count = static_cast<int>(std::count(line.begin(), line.end(), candidates[i]));
            if (expected_count < 0) {
                expected_count = count;
            } else if (count != expected_count) {
                consistent = false;
                break;
            }
        }

        if (consistent && expected_count > 0) {
            return candidates[i];
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return candidates[best];
}

std::optional<double> parseCell(std::string_view cell) {
    const auto trimmed = trimView(cell);
    if (trimmed.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const std::string text(trimmed);
    try {
        size_t pos = 0;
        const double value = std::stod(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

SoundingTable parseSoundingCsv(
    std::string_view text,
    const CsvReadOptions& options,
    const ColumnNames& names,
    const HydrostaticSettings& hydrostatic
) {
    const auto lines = splitLines(stripBom(text));
    if (lines.empty()) {
        throw ParseError("Файл не содержит строки заголовка", 0);
    }

    char delimiter = ';';
    if (options.delimiter.has_value()) {
        delimiter = *options.delimiter;
    } else {
        std::vector<std::string> sample;
        for (size_t i = 0; i < lines.size() && i < options.detection_lines; ++i) {
            sample.emplace_back(lines[i].text);
        }
        delimiter = detectDelimiter(sample);
    }

    const auto header = splitCells(lines.front().text, delimiter);

    // Маппинг входных колонок на позиции в заголовке
    std::array<std::optional<size_t>, kInputColumns.size()> positions;
    std::vector<std::string> missing;
    for (size_t k = 0; k < kInputColumns.size(); ++k) {
        positions[k] = findHeaderColumn(header, names.name(kInputColumns[k]));
        const bool required = std::find(kRequiredInputColumns.begin(), kRequiredInputColumns.end(),
                                        kInputColumns[k]) != kRequiredInputColumns.end();
        if (!positions[k].has_value() && required) {
            missing.push_back(names.name(kInputColumns[k]));
        }
    }

    if (!missing.empty()) {
        std::string list;
        for (const auto& name : missing) {
            if (!list.empty()) list += ", ";
            list += "'" + name + "'";
        }
        throw SchemaError("Отсутствуют обязательные колонки: " + list, std::move(missing));
    }

    std::array<std::vector<double>, kInputColumns.size()> values;
    for (auto& column : values) {
        column.reserve(lines.size() - 1);
    }

    for (size_t row = 1; row < lines.size(); ++row) {
        const auto& line = lines[row];
        const auto cells = splitCells(line.text, delimiter);
        if (cells.size() < header.size()) {
            throw ParseError(
                "Строка " + std::to_string(line.number) + ": ожидалось " +
                std::to_string(header.size()) + " ячеек, получено " +
                std::to_string(cells.size()),
                line.number
            );
        }

        for (size_t k = 0; k < kInputColumns.size(); ++k) {
            if (!positions[k].has_value()) continue;

            const auto& cell = cells[*positions[k]];
            const auto parsed = parseCell(cell);
            if (!parsed.has_value()) {
                const auto& column_name = names.name(kInputColumns[k]);
                throw ParseError(
                    "Строка " + std::to_string(line.number) + ", колонка '" + column_name +
                    "': не удалось разобрать число \"" + cell + "\"",
                    line.number,
                    column_name
                );
            }
            values[k].push_back(*parsed);
        }
    }

    SoundingTable table;
    for (size_t k = 0; k < kInputColumns.size(); ++k) {
        if (positions[k].has_value()) {
            table.setColumn(kInputColumns[k], std::move(values[k]));
        }
    }

    if (!table.hasColumn(Column::U0)) {
        table = core::addHydrostaticPressure(table, hydrostatic);
    }
    return table;
}

SoundingTable readSoundingCsv(
    const std::filesystem::path& path,
    const CsvReadOptions& options,
    const ColumnNames& names,
    const HydrostaticSettings& hydrostatic
) {
    const auto text = readTextFile(path);
    return parseSoundingCsv(text, options, names, hydrostatic);
}

} // namespace conic::io

/**
 * @file csv_writer.cpp
 * @brief Реализация экспорта в CSV
 */

#include "csv_writer.hpp"
#include "file_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace conic::io {

namespace {

/// Количество символов UTF-8 строки (для выравнивания)
size_t displayWidth(std::string_view text) noexcept {
    size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string cellText(const SoundingTable& table, Column column, size_t row, int precision, char decimal_sep) {
    if (column == Column::Convergence) {
        return formatConvergence(table.convergence()[row]);
    }
    return formatValue(table.values(column)[row], precision, decimal_sep);
}

} // namespace

std::string formatValue(double value, int precision, char decimal_sep) {
    if (std::isnan(value)) {
        return "";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string result = ss.str();

    if (decimal_sep != '.') {
        std::replace(result.begin(), result.end(), '.', decimal_sep);
    }
    return result;
}

std::string formatConvergence(ConvergenceState state) {
    if (state == ConvergenceState::NotApplicable) {
        return "";
    }
    return toString(state);
}

std::string formatSoundingCsv(
    const SoundingTable& table,
    const ColumnNames& names,
    const CsvExportOptions& options
) {
    const auto& columns = table.columns();
    std::ostringstream out;

    if (options.include_header) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << quoteCell(names.name(columns[i]), options.delimiter);
        }
        out << '\n';
    }

    for (size_t row = 0; row < table.rowCount(); ++row) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << quoteCell(
                cellText(table, columns[i], row, options.decimal_places, options.decimal_separator),
                options.delimiter
            );
        }
        out << '\n';
    }

    return out.str();
}

void writeSoundingCsv(
    const SoundingTable& table,
    const ColumnNames& names,
    const std::filesystem::path& path,
    const CsvExportOptions& options
) {
    atomicWrite(path, formatSoundingCsv(table, names, options));
}

std::string formatPreview(
    const SoundingTable& table,
    const ColumnNames& names,
    size_t rows
) {
    constexpr int kPreviewPrecision = 3;
    const auto& columns = table.columns();
    const size_t shown = std::min(rows, table.rowCount());

    // Ячейки: заголовок + строки
    std::vector<std::vector<std::string>> cells(shown + 1);
    std::vector<size_t> widths(columns.size(), 0);
    for (size_t i = 0; i < columns.size(); ++i) {
        cells[0].push_back(names.name(columns[i]));
        for (size_t row = 0; row < shown; ++row) {
            auto text = cellText(table, columns[i], row, kPreviewPrecision, '.');
            cells[row + 1].push_back(text.empty() ? "-" : std::move(text));
        }
        for (const auto& line : cells) {
            widths[i] = std::max(widths[i], displayWidth(line[i]));
        }
    }

    std::ostringstream out;
    for (const auto& line : cells) {
        for (size_t i = 0; i < line.size(); ++i) {
            if (i > 0) out << "  ";
            const size_t pad = widths[i] - displayWidth(line[i]);
            out << std::string(pad, ' ') << line[i];
        }
        out << '\n';
    }

    if (table.rowCount() > shown) {
        out << "... (" << table.rowCount() << " строк)\n";
    }
    return out.str();
}

} // namespace conic::io

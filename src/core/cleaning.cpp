/**
 * @file cleaning.cpp
 * @brief Реализация очистки строк
 */

#include "cleaning.hpp"
#include <algorithm>
#include <utility>

namespace conic::core {

namespace {

bool isIndicator(double value, const std::vector<double>& indicators) noexcept {
    // NaN не равен ничему, в том числе NaN в списке кодов
    return std::find(indicators.begin(), indicators.end(), value) != indicators.end();
}

} // namespace

std::vector<bool> flagRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
) {
    std::vector<bool> flags(table.rowCount(), false);
    if (indicators.empty()) return flags;

    for (Column column : table.numericColumns()) {
        const auto& values = table.values(column);
        for (size_t row = 0; row < values.size(); ++row) {
            if (!flags[row] && isIndicator(values[row], indicators)) {
                flags[row] = true;
            }
        }
    }
    return flags;
}

size_t countFlaggedRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
) {
    const auto flags = flagRows(table, indicators);
    return static_cast<size_t>(std::count(flags.begin(), flags.end(), true));
}

SoundingTable removeRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
) {
    const auto flags = flagRows(table, indicators);

    std::vector<size_t> kept;
    kept.reserve(flags.size());
    for (size_t row = 0; row < flags.size(); ++row) {
        if (!flags[row]) {
            kept.push_back(row);
        }
    }
    return table.selectRows(kept);
}

SoundingTable replaceRows(
    const SoundingTable& table,
    const std::vector<double>& indicators,
    double replacement
) {
    const auto flags = flagRows(table, indicators);
    SoundingTable result = table;

    for (Column column : table.numericColumns()) {
        if (column == Column::Depth) continue;

        std::vector<double> values = table.values(column);
        for (size_t row = 0; row < values.size(); ++row) {
            if (flags[row]) {
                values[row] = replacement;
            }
        }
        result.setColumn(column, std::move(values));
    }
    return result;
}

} // namespace conic::core

/**
 * @file depth_adjust.cpp
 * @brief Реализация регуляризации глубины
 */

#include "depth_adjust.hpp"
#include "model/errors.hpp"
#include <cmath>
#include <utility>
#include <vector>

namespace conic::core {

double roundSpacing(double spacing) noexcept {
    return std::round(spacing * 1000.0) / 1000.0;
}

double inferDepthSpacing(const SoundingTable& table) {
    if (table.rowCount() < 2) {
        throw InvalidDataError(
            "Невозможно определить шаг глубины: в таблице меньше двух строк"
        );
    }

    const auto& depth = table.values(Column::Depth);
    double sum = 0.0;
    size_t count = 0;
    for (size_t i = 1; i < depth.size(); ++i) {
        const double diff = depth[i] - depth[i - 1];
        if (std::isnan(diff)) continue;
        sum += diff;
        ++count;
    }

    if (count == 0) {
        throw InvalidDataError(
            "Невозможно определить шаг глубины: все разности глубин отсутствуют"
        );
    }
    return roundSpacing(sum / static_cast<double>(count));
}

SoundingTable adjustDepth(
    const SoundingTable& table,
    const DepthAdjustOptions& options
) {
    const size_t n = table.rowCount();
    if (n == 0) {
        throw InvalidDataError("Невозможно регуляризовать глубину: таблица пуста");
    }
    if (n == 1 && !options.spacing.has_value()) {
        throw InvalidDataError(
            "Невозможно регуляризовать глубину: в таблице одна строка, "
            "а шаг не задан (автоматический расчёт невозможен)"
        );
    }

    double start = 0.0;
    if (options.start.has_value()) {
        start = *options.start;
    } else {
        start = table.value(Column::Depth, 0);
        if (std::isnan(start)) {
            throw InvalidDataError(
                "Невозможно регуляризовать глубину: первая глубина отсутствует"
            );
        }
    }

    const double spacing = options.spacing.has_value()
        ? roundSpacing(*options.spacing)
        : inferDepthSpacing(table);

    std::vector<double> depth(n);
    for (size_t i = 0; i < n; ++i) {
        depth[i] = start + static_cast<double>(i) * spacing;
    }
    return table.withColumn(Column::Depth, std::move(depth));
}

} // namespace conic::core

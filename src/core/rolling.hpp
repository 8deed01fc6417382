/**
 * @file rolling.hpp
 * @brief Центрированное скользящее окно
 *
 * Окно нечётной длины W. Для ⌊W/2⌋ крайних строк с каждой стороны
 * результат NaN (частичные окна не усредняются).
 */

#pragma once

#include "model/errors.hpp"
#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <vector>

namespace conic::core {

/**
 * @brief Применить агрегатор к центрированному окну
 *
 * @param values Исходный ряд
 * @param window Длина окна (нечётная, ≥ 1)
 * @param aggregator Функция double(std::span<const double>)
 * @return Ряд той же длины
 * @throws model::InvalidDataError Для нулевого или чётного окна
 */
template <typename Aggregator>
[[nodiscard]] std::vector<double> rollingCentered(
    const std::vector<double>& values,
    int window,
    Aggregator aggregator
) {
    if (window <= 0 || window % 2 == 0) {
        throw model::InvalidDataError(
            "Длина окна сглаживания должна быть положительной и нечётной, получено " +
            std::to_string(window)
        );
    }

    const size_t n = values.size();
    const size_t width = static_cast<size_t>(window);
    const size_t half = width / 2;
    std::vector<double> result(n, std::numeric_limits<double>::quiet_NaN());

    if (n < width) {
        return result;
    }

    const std::span<const double> all(values);
    for (size_t i = half; i + half < n; ++i) {
        result[i] = aggregator(all.subspan(i - half, width));
    }
    return result;
}

/**
 * @brief Скользящее среднее (NaN внутри окна даёт NaN)
 */
[[nodiscard]] inline std::vector<double> rollingMean(const std::vector<double>& values, int window) {
    if (window == 1) {
        return values;
    }
    return rollingCentered(values, window, [](std::span<const double> w) {
        double sum = 0.0;
        for (double v : w) {
            sum += v;
        }
        return sum / static_cast<double>(w.size());
    });
}

} // namespace conic::core

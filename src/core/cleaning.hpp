/**
 * @file cleaning.hpp
 * @brief Очистка строк с кодами ошибок датчиков
 *
 * Сравнение с кодами точное (==), без допуска. Проверка горизонтальная:
 * строка помечена, если код встретился в любой её числовой колонке,
 * включая глубину.
 */

#pragma once

#include "model/sounding_table.hpp"
#include <cstddef>
#include <vector>

namespace conic::core {

using namespace conic::model;

/**
 * @brief Признак «строка содержит код ошибки» для каждой строки
 */
[[nodiscard]] std::vector<bool> flagRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
);

/**
 * @brief Количество помеченных строк
 */
[[nodiscard]] size_t countFlaggedRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
);

/**
 * @brief Удалить помеченные строки
 *
 * Относительный порядок оставшихся строк сохраняется.
 */
[[nodiscard]] SoundingTable removeRows(
    const SoundingTable& table,
    const std::vector<double>& indicators
);

/**
 * @brief Заменить значения в помеченных строках
 *
 * Все колонки, кроме глубины, получают значение replacement.
 * Непомеченные строки и колонка глубины не изменяются.
 * Количество строк сохраняется.
 */
[[nodiscard]] SoundingTable replaceRows(
    const SoundingTable& table,
    const std::vector<double>& indicators,
    double replacement
);

} // namespace conic::core

/**
 * @file depth_adjust.hpp
 * @brief Регуляризация глубины
 *
 * Глубина заменяется арифметической прогрессией depth[i] = start + i·spacing.
 * Остальные колонки не изменяются.
 */

#pragma once

#include "model/sounding_table.hpp"
#include <optional>

namespace conic::core {

using namespace conic::model;

/**
 * @brief Параметры регуляризации
 */
struct DepthAdjustOptions {
    std::optional<double> start;    ///< nullopt - первая глубина таблицы
    std::optional<double> spacing;  ///< nullopt - средний шаг таблицы
};

/**
 * @brief Шаг глубины в таблице по умолчанию
 *
 * Среднее последовательных разностей глубины без учёта пропусков (NaN),
 * округлённое до 3 знаков.
 *
 * @throws InvalidDataError Если строк меньше двух или все разности NaN
 */
[[nodiscard]] double inferDepthSpacing(const SoundingTable& table);

/**
 * @brief Округление шага до 3 знаков после запятой
 */
[[nodiscard]] double roundSpacing(double spacing) noexcept;

/**
 * @brief Построить регулярную глубину
 *
 * Заданный шаг также округляется до 3 знаков.
 *
 * @throws InvalidDataError Таблица пуста; одна строка без заданного шага;
 *         первая глубина отсутствует и start не задан; шаг не вычисляется
 */
[[nodiscard]] SoundingTable adjustDepth(
    const SoundingTable& table,
    const DepthAdjustOptions& options = {}
);

} // namespace conic::core

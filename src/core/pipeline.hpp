/**
 * @file pipeline.hpp
 * @brief Полная обработка данных зондирования
 *
 * Координирует стадии: очистка → (регуляризация глубины) → напряжения → Ic.
 * Каждая стадия получает таблицу предыдущей и возвращает новую.
 */

#pragma once

#include "model/config.hpp"
#include "model/sounding_table.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conic::core {

using namespace conic::model;

/**
 * @brief Callback для индикации прогресса
 *
 * @param progress Прогресс от 0.0 до 1.0
 * @param message Описание текущей операции
 */
using ProgressCallback = std::function<void(double progress, std::string_view message)>;

/**
 * @brief Сводка обработки
 */
struct PipelineSummary {
    size_t rows_read = 0;
    size_t rows_removed = 0;
    size_t rows_replaced = 0;
    size_t rows_out = 0;
    size_t converged = 0;
    size_t not_converged = 0;
    size_t not_applicable = 0;
    std::optional<double> depth_spacing;    ///< Шаг после регуляризации
};

/**
 * @brief Результат обработки
 */
struct PipelineResult {
    SoundingTable table;
    PipelineSummary summary;
    std::vector<std::string> warnings;
};

/**
 * @brief Полная обработка таблицы зондирования
 *
 * Выполняет:
 * 1. Очистку строк с кодами ошибок (remove / replace / none)
 * 2. Регуляризацию глубины (если включена)
 * 3. Расчёт напряжений, Fr, Bq
 * 4. Итерационный расчёт n, Qtn, Ic (и Cd, Ib)
 *
 * Конфигурация проверяется (validateConfig) до обработки первой строки.
 * При ошибке стадии бросается исключение, частичный результат не возвращается.
 *
 * @param raw Таблица загрузчика
 * @param config Конфигурация
 * @param on_progress Callback прогресса (опционально)
 * @throws ConfigError Если конфигурация некорректна
 */
[[nodiscard]] PipelineResult runPipeline(
    const SoundingTable& raw,
    const ConicConfig& config,
    ProgressCallback on_progress = nullptr
);

} // namespace conic::core

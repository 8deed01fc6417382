/**
 * @file summary_writer.hpp
 * @brief Запись сводки обработки в JSON
 */

#pragma once

#include "core/pipeline.hpp"
#include "model/config.hpp"
#include <filesystem>
#include <string>

namespace conic::io {

/**
 * @brief Сведения о запуске
 */
struct RunMeta {
    std::string app_version;
    std::string input_path;
    std::string timestamp;          ///< Пусто - текущее время
};

/**
 * @brief Текущее время в формате YYYY-MM-DDTHH:MM:SS
 */
[[nodiscard]] std::string currentTimestamp();

/**
 * @brief Сформировать JSON сводки
 *
 * Содержит сведения о запуске, конфигурацию, счётчики строк,
 * статистику по колонкам (min/max по конечным значениям) и предупреждения.
 */
[[nodiscard]] std::string formatRunSummary(
    const core::PipelineResult& result,
    const model::ConicConfig& config,
    const RunMeta& meta,
    int indent = 2
);

/**
 * @brief Записать сводку в файл (атомарная запись)
 *
 * @throws model::IoError При ошибке записи
 */
void writeRunSummary(
    const core::PipelineResult& result,
    const model::ConicConfig& config,
    const RunMeta& meta,
    const std::filesystem::path& path
);

} // namespace conic::io

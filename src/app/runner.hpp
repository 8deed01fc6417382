/**
 * @file runner.hpp
 * @brief Разбор командной строки и запуск обработки
 */

#pragma once

#include "core/pipeline.hpp"
#include "model/config.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace conic::app {

/**
 * @brief Параметры командной строки
 */
struct CommandOptions {
    std::filesystem::path input;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> summary;
    size_t head = 8;                                    ///< Строк в предпросмотре
    std::optional<char> delimiter;
    std::optional<model::CleaningMode> cleaning_mode;
    bool adjust_depth = false;
    std::optional<double> start;
    std::optional<double> spacing;
    std::optional<int> window;
    bool show_help = false;
};

struct CommandResult {
    int exit_code = 1;
    core::PipelineResult pipeline;
};

/**
 * @brief Текст справки
 */
[[nodiscard]] std::string usageText();

/**
 * @brief Разбор аргументов
 * @throws std::invalid_argument При неизвестном ключе или отсутствии значения
 */
[[nodiscard]] CommandOptions parseCommandLine(int argc, const char* const argv[]);

/**
 * @brief Конфигурация из файла (если задан) с переопределениями из командной строки
 * @throws model::ConfigError Если итоговая конфигурация некорректна
 */
[[nodiscard]] model::ConicConfig buildConfig(const CommandOptions& options);

/**
 * @brief Выполнить обработку: чтение, конвейер, предпросмотр, запись
 *
 * Прогресс и предупреждения печатаются в out и err.
 * Исключения стадий пробрасываются вызывающему.
 */
CommandResult runCommand(
    const CommandOptions& options,
    std::ostream& out,
    std::ostream& err
);

} // namespace conic::app

/**
 * @file runner.cpp
 * @brief Разбор командной строки и запуск обработки
 */

#include "runner.hpp"
#include "io/config_io.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/summary_writer.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <iomanip>
#include <limits>
#include <string>
#include <stdexcept>
#include <string_view>

#ifndef CONIC_VERSION
#define CONIC_VERSION "dev"
#endif

namespace conic::app {
namespace {

using namespace conic::model;

std::string_view requireValue(int argc, const char* const argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument("Не задано значение для " + std::string(argv[i]));
    }
    return argv[++i];
}

/**
 * @brief Целое значение параметра; строка должна быть числом целиком
 */
long parseInteger(std::string_view option, std::string_view text) {
    const std::string value(text);
    const auto fail = [&]() {
        return std::invalid_argument(
            "Некорректное целое значение для " + std::string(option) + ": \"" + value + "\"");
    };

    size_t pos = 0;
    long result = 0;
    try {
        result = std::stol(value, &pos);
    } catch (const std::invalid_argument&) {
        throw fail();
    } catch (const std::out_of_range&) {
        throw fail();
    }
    if (pos != value.size()) {
        throw fail();
    }
    return result;
}

double parseReal(std::string_view option, std::string_view text) {
    const std::string value(text);
    const auto fail = [&]() {
        return std::invalid_argument(
            "Некорректное число для " + std::string(option) + ": \"" + value + "\"");
    };

    size_t pos = 0;
    double result = 0;
    try {
        result = std::stod(value, &pos);
    } catch (const std::invalid_argument&) {
        throw fail();
    } catch (const std::out_of_range&) {
        throw fail();
    }
    if (pos != value.size()) {
        throw fail();
    }
    return result;
}

} // namespace

std::string usageText() {
    return
        "Использование: conic --input <файл.csv> [опции]\n"
        "\n"
        "  --input <путь>        Входной CSV с данными CPTu\n"
        "  --config <путь>       Конфигурация (JSON)\n"
        "  --output <путь>       Сохранить результат в CSV\n"
        "  --summary <путь>      Сохранить сводку обработки (JSON)\n"
        "  --head <N>            Строк в предпросмотре (по умолчанию 8)\n"
        "  --delimiter <X>       Разделитель входного CSV (tab - табуляция)\n"
        "  --remove              Удалять строки с кодами ошибок (по умолчанию)\n"
        "  --replace             Заменять значения в строках с кодами ошибок\n"
        "  --no-clean            Не выполнять очистку\n"
        "  --adjust-depth        Регуляризовать глубину\n"
        "  --start <м>           Начальная глубина при регуляризации\n"
        "  --spacing <м>         Шаг глубины при регуляризации\n"
        "  --window <W>          Окно сглаживания: 1, 3 или 5\n"
        "  --help                Показать эту справку\n";
}

CommandOptions parseCommandLine(int argc, const char* const argv[]) {
    CommandOptions options;
    bool has_input = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--input") {
            options.input = std::filesystem::path(requireValue(argc, argv, i));
            has_input = true;
        } else if (arg == "--config") {
            options.config_path = std::filesystem::path(requireValue(argc, argv, i));
        } else if (arg == "--output") {
            options.output = std::filesystem::path(requireValue(argc, argv, i));
        } else if (arg == "--summary") {
            options.summary = std::filesystem::path(requireValue(argc, argv, i));
        } else if (arg == "--head") {
            const long head = parseInteger(arg, requireValue(argc, argv, i));
            if (head < 0) {
                throw std::invalid_argument("--head не может быть отрицательным");
            }
            options.head = static_cast<size_t>(head);
        } else if (arg == "--delimiter") {
            options.delimiter = io::parseDelimiter(requireValue(argc, argv, i));
        } else if (arg == "--remove") {
            options.cleaning_mode = CleaningMode::Remove;
        } else if (arg == "--replace") {
            options.cleaning_mode = CleaningMode::Replace;
        } else if (arg == "--no-clean") {
            options.cleaning_mode = CleaningMode::None;
        } else if (arg == "--adjust-depth") {
            options.adjust_depth = true;
        } else if (arg == "--start") {
            options.start = parseReal(arg, requireValue(argc, argv, i));
        } else if (arg == "--spacing") {
            options.spacing = parseReal(arg, requireValue(argc, argv, i));
        } else if (arg == "--window") {
            const long window = parseInteger(arg, requireValue(argc, argv, i));
            if (window < std::numeric_limits<int>::min() || window > std::numeric_limits<int>::max()) {
                throw std::invalid_argument("Слишком большое окно сглаживания: " + std::to_string(window));
            }
            options.window = static_cast<int>(window);
        } else {
            throw std::invalid_argument("Неизвестный параметр: " + std::string(arg));
        }
    }

    if (!has_input && !options.show_help) {
        throw std::invalid_argument("Не задан входной файл (--input)");
    }
    if ((options.start.has_value() || options.spacing.has_value()) && !options.adjust_depth) {
        throw std::invalid_argument("--start и --spacing используются только с --adjust-depth");
    }
    return options;
}

ConicConfig buildConfig(const CommandOptions& options) {
    ConicConfig config;
    if (options.config_path.has_value()) {
        config = io::loadConfig(*options.config_path);
    }

    if (options.delimiter.has_value()) {
        config.csv.delimiter = options.delimiter;
    }
    if (options.cleaning_mode.has_value()) {
        config.cleaning.mode = *options.cleaning_mode;
    }
    if (options.adjust_depth) {
        config.depth_adjustment.enabled = true;
        if (options.start.has_value()) config.depth_adjustment.start = options.start;
        if (options.spacing.has_value()) config.depth_adjustment.spacing = options.spacing;
    }
    if (options.window.has_value()) {
        config.stress.rolling_window = *options.window;
    }

    const auto validation = validateConfig(config);
    if (!validation.is_valid) {
        throw ConfigError("Некорректные параметры: " + validation.errorSummary());
    }
    return config;
}

CommandResult runCommand(
    const CommandOptions& options,
    std::ostream& out,
    std::ostream& err
) {
    CommandResult result;

    const ConicConfig config = buildConfig(options);
    for (const auto& warning : validateConfig(config).warnings) {
        err << "Предупреждение: " << warning << "\n";
    }

    io::CsvReadOptions read_options;
    read_options.delimiter = config.csv.delimiter;
    const auto raw = io::readSoundingCsv(options.input, read_options, config.columns, config.hydrostatic);
    out << "Прочитано строк: " << raw.rowCount() << " (" << options.input.string() << ")\n";

    auto on_progress = [&out](double progress, std::string_view message) {
        out << "[" << std::setw(3) << static_cast<int>(progress * 100.0) << "%] " << message << "\n";
    };
    result.pipeline = core::runPipeline(raw, config, on_progress);

    const auto& summary = result.pipeline.summary;
    out << "Удалено строк: " << summary.rows_removed
        << ", заменено: " << summary.rows_replaced
        << ", итого: " << summary.rows_out << "\n";
    out << "Сходимость: " << summary.converged << " сошлось, "
        << summary.not_converged << " не сошлось, "
        << summary.not_applicable << " не классифицировано\n";
    if (summary.depth_spacing.has_value()) {
        out << "Шаг глубины: " << *summary.depth_spacing << " м\n";
    }

    for (const auto& warning : result.pipeline.warnings) {
        err << "Предупреждение: " << warning << "\n";
    }

    if (options.head > 0) {
        out << "\n" << io::formatPreview(result.pipeline.table, config.columns, options.head) << "\n";
    }

    if (options.output.has_value()) {
        io::writeSoundingCsv(result.pipeline.table, config.columns, *options.output);
        out << "Результат сохранён: " << options.output->string() << "\n";
    }

    if (options.summary.has_value()) {
        io::RunMeta meta;
        meta.app_version = CONIC_VERSION;
        meta.input_path = options.input.string();
        io::writeRunSummary(result.pipeline, config, meta, *options.summary);
        out << "Сводка сохранена: " << options.summary->string() << "\n";
    }

    result.exit_code = 0;
    return result;
}

} // namespace conic::app

/**
 * @file pipeline.cpp
 * @brief Реализация полной обработки
 */

#include "pipeline.hpp"
#include "behavior.hpp"
#include "cleaning.hpp"
#include "depth_adjust.hpp"
#include "stress.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <string>
#include <utility>

namespace conic::core {

namespace {

void countConvergence(const SoundingTable& table, PipelineSummary& summary) {
    for (ConvergenceState state : table.convergence()) {
        switch (state) {
            case ConvergenceState::Converged: ++summary.converged; break;
            case ConvergenceState::NotConverged: ++summary.not_converged; break;
            case ConvergenceState::NotApplicable: ++summary.not_applicable; break;
        }
    }
}

} // namespace

PipelineResult runPipeline(
    const SoundingTable& raw,
    const ConicConfig& config,
    ProgressCallback on_progress
) {
    const auto validation = validateConfig(config);
    if (!validation.is_valid) {
        throw ConfigError("Некорректные параметры: " + validation.errorSummary());
    }

    PipelineResult result;
    result.summary.rows_read = raw.rowCount();

    auto reportProgress = [&on_progress](double p, std::string_view msg) {
        if (on_progress) on_progress(p, msg);
    };

    reportProgress(0.0, "Очистка данных...");

    SoundingTable table;
    const auto& indicators = config.cleaning.indicators;
    switch (config.cleaning.mode) {
        case CleaningMode::Remove:
            table = removeRows(raw, indicators);
            result.summary.rows_removed = raw.rowCount() - table.rowCount();
            break;
        case CleaningMode::Replace:
            result.summary.rows_replaced = countFlaggedRows(raw, indicators);
            table = replaceRows(raw, indicators, config.cleaning.replacement);
            break;
        case CleaningMode::None:
            table = raw;
            break;
    }

    if (config.depth_adjustment.enabled) {
        reportProgress(0.2, "Регуляризация глубины...");
        const DepthAdjustOptions options{
            config.depth_adjustment.start,
            config.depth_adjustment.spacing
        };
        SoundingTable adjusted = adjustDepth(table, options);
        // Шаг берётся тем же способом, что и в adjustDepth, без вычитания глубин
        result.summary.depth_spacing = options.spacing.has_value()
            ? roundSpacing(*options.spacing)
            : inferDepthSpacing(table);
        table = std::move(adjusted);
    }

    for (auto& warning : validateSoundingTable(table).warnings) {
        result.warnings.push_back(std::move(warning));
    }

    reportProgress(0.4, "Расчёт напряжений...");
    table = addStressColumns(table, config.stress);

    reportProgress(0.6, "Расчёт индекса Ic...");
    table = addBehaviorColumns(table, config.solver, config.solver.secondary_indices);

    countConvergence(table, result.summary);
    result.summary.rows_out = table.rowCount();

    if (result.summary.not_converged > 0) {
        result.warnings.push_back(
            "Итерации не сошлись в " + std::to_string(result.summary.not_converged) +
            " строках (max_iter = " + std::to_string(config.solver.max_iter) + ")"
        );
    }
    if (result.summary.not_applicable > 0) {
        result.warnings.push_back(
            std::to_string(result.summary.not_applicable) +
            " строк не классифицированы (Fr < 0 или отсутствует)"
        );
    }

    result.table = std::move(table);
    reportProgress(1.0, "Обработка завершена");
    return result;
}

} // namespace conic::core

/**
 * @file validation.hpp
 * @brief Валидация конфигурации и данных зондирования
 */

#pragma once

#include "config.hpp"
#include "sounding_table.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace conic::model {

/**
 * @brief Тип ошибки валидации
 */
enum class ValidationErrorType {
    OutOfRange,             ///< Значение вне допустимого диапазона
    InvalidValue,           ///< Некорректное значение
    MissingRequiredField,   ///< Отсутствует обязательное поле
    DuplicateName           ///< Повторяющееся имя колонки
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;               ///< Имя параметра с ошибкой
    std::string message;             ///< Описание ошибки
    std::optional<size_t> row_index; ///< Индекс строки (для ошибок в данных)

    [[nodiscard]] std::string toString() const {
        if (row_index.has_value()) {
            return "Строка " + std::to_string(*row_index + 1) + ": " + message;
        }
        return message;
    }
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<std::string> warnings;  ///< Некритичные замечания

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& message, std::optional<size_t> row_idx = std::nullopt) {
        is_valid = false;
        errors.push_back({type, field, message, row_idx});
    }

    void addWarning(const std::string& message) {
        warnings.push_back(message);
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
    [[nodiscard]] bool hasWarnings() const noexcept { return !warnings.empty(); }

    /**
     * @brief Все ошибки одной строкой (для текста исключения)
     */
    [[nodiscard]] std::string errorSummary() const {
        std::string result;
        for (const auto& err : errors) {
            if (!result.empty()) result += "; ";
            result += err.toString();
        }
        return result;
    }
};

namespace validation_limits {
    constexpr double kDepthTolerance = 1e-6;   ///< Толеранс для сравнения глубин
}

/**
 * @brief Проверка конфигурации
 *
 * Собирает все нарушения, а не только первое.
 */
[[nodiscard]] inline ValidationResult validateConfig(const ConicConfig& config) {
    ValidationResult result;

    if (!std::isfinite(config.stress.area_ratio)) {
        result.addError(ValidationErrorType::InvalidValue, "area_ratio",
            "area_ratio должен быть конечным числом");
    } else if (config.stress.area_ratio < 0.0 || config.stress.area_ratio > 1.0) {
        result.addWarning("area_ratio = " + std::to_string(config.stress.area_ratio) +
            " вне типичного диапазона [0, 1]");
    }

    if (!(config.stress.gamma_soil.value > 0.0) || !std::isfinite(config.stress.gamma_soil.value)) {
        result.addError(ValidationErrorType::OutOfRange, "gamma_soil",
            "gamma_soil должен быть положительным числом, получено " +
            std::to_string(config.stress.gamma_soil.value));
    }

    if (!(config.hydrostatic.gamma_w.value > 0.0) || !std::isfinite(config.hydrostatic.gamma_w.value)) {
        result.addError(ValidationErrorType::OutOfRange, "gamma_w",
            "gamma_w должен быть положительным числом, получено " +
            std::to_string(config.hydrostatic.gamma_w.value));
    }

    if (!std::isfinite(config.hydrostatic.water_level.value)) {
        result.addError(ValidationErrorType::InvalidValue, "water_level",
            "water_level должен быть конечным числом");
    }

    if (std::find(kAllowedRollingWindows.begin(), kAllowedRollingWindows.end(),
                  config.stress.rolling_window) == kAllowedRollingWindows.end()) {
        result.addError(ValidationErrorType::InvalidValue, "rolling_window",
            "rolling_window должен быть одним из {1, 3, 5}, получено " +
            std::to_string(config.stress.rolling_window));
    }

    if (!(config.solver.p_ref.value > 0.0) || !std::isfinite(config.solver.p_ref.value)) {
        result.addError(ValidationErrorType::OutOfRange, "p_ref",
            "p_ref должен быть положительным числом, получено " +
            std::to_string(config.solver.p_ref.value));
    }

    if (config.solver.max_iter <= 0) {
        result.addError(ValidationErrorType::OutOfRange, "max_iter",
            "max_iter должен быть положительным целым, получено " +
            std::to_string(config.solver.max_iter));
    }

    if (!(config.solver.tolerance > 0.0) || !std::isfinite(config.solver.tolerance)) {
        result.addError(ValidationErrorType::OutOfRange, "tolerance",
            "tolerance должен быть положительным числом, получено " +
            std::to_string(config.solver.tolerance));
    }

    if (config.cleaning.mode != CleaningMode::None && config.cleaning.indicators.empty()) {
        result.addWarning("Список кодов ошибок датчиков пуст - очистка ничего не изменит");
    }

    if (config.cleaning.mode == CleaningMode::Replace &&
        std::find(config.cleaning.indicators.begin(), config.cleaning.indicators.end(),
                  config.cleaning.replacement) != config.cleaning.indicators.end()) {
        result.addError(ValidationErrorType::InvalidValue, "replacement",
            "Значение замены не должно входить в список кодов ошибок");
    }

    if (config.depth_adjustment.spacing.has_value() &&
        !std::isfinite(*config.depth_adjustment.spacing)) {
        result.addError(ValidationErrorType::InvalidValue, "depth_adjustment.spacing",
            "Шаг глубины должен быть конечным числом");
    }

    if (config.depth_adjustment.start.has_value() &&
        !std::isfinite(*config.depth_adjustment.start)) {
        result.addError(ValidationErrorType::InvalidValue, "depth_adjustment.start",
            "Начальная глубина должна быть конечным числом");
    }

    // Имена входных колонок должны различаться, иначе маппинг неоднозначен
    for (size_t i = 0; i < kInputColumns.size(); ++i) {
        const auto& name_i = config.columns.name(kInputColumns[i]);
        if (name_i.empty()) {
            result.addError(ValidationErrorType::MissingRequiredField,
                std::string(columnKey(kInputColumns[i])),
                "Пустое имя входной колонки '" + std::string(columnKey(kInputColumns[i])) + "'");
            continue;
        }
        for (size_t j = i + 1; j < kInputColumns.size(); ++j) {
            if (name_i == config.columns.name(kInputColumns[j])) {
                result.addError(ValidationErrorType::DuplicateName,
                    std::string(columnKey(kInputColumns[j])),
                    "Колонки '" + std::string(columnKey(kInputColumns[i])) + "' и '" +
                    std::string(columnKey(kInputColumns[j])) + "' имеют одинаковое имя \"" +
                    name_i + "\"");
            }
        }
    }

    return result;
}

/**
 * @brief Проверка таблицы зондирования
 *
 * Ошибок данных здесь не бывает (NaN допустим), только предупреждения:
 * немонотонная или повторяющаяся глубина.
 */
[[nodiscard]] inline ValidationResult validateSoundingTable(const SoundingTable& table) {
    ValidationResult result;

    if (table.empty()) {
        result.addWarning("Таблица не содержит строк");
        return result;
    }
    if (!table.hasColumn(Column::Depth)) {
        result.addError(ValidationErrorType::MissingRequiredField, "depth",
            "В таблице нет колонки глубины");
        return result;
    }

    const auto& depth = table.values(Column::Depth);
    size_t non_monotonic = 0;
    size_t duplicates = 0;
    std::optional<size_t> first_non_monotonic;

    for (size_t i = 1; i < depth.size(); ++i) {
        if (std::isnan(depth[i]) || std::isnan(depth[i - 1])) continue;
        if (depth[i] < depth[i - 1] - validation_limits::kDepthTolerance) {
            ++non_monotonic;
            if (!first_non_monotonic.has_value()) {
                first_non_monotonic = i;
            }
        } else if (std::abs(depth[i] - depth[i - 1]) < validation_limits::kDepthTolerance) {
            ++duplicates;
        }
    }

    if (non_monotonic > 0) {
        result.addWarning("Глубина убывает в " + std::to_string(non_monotonic) +
            " местах (первое - строка " + std::to_string(*first_non_monotonic + 1) + ")");
    }
    if (duplicates > 0) {
        result.addWarning(std::to_string(duplicates) + " строк повторяют глубину предыдущей");
    }

    return result;
}

} // namespace conic::model

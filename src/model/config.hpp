/**
 * @file config.hpp
 * @brief Настройки обработки данных зондирования
 *
 * Конфигурация загружается один раз, проверяется и далее передаётся
 * в стадии конвейера по const-ссылке.
 */

#pragma once

#include "types.hpp"
#include <array>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conic::model {

/**
 * @brief Отображаемые имена колонок (заголовки входного и выходного CSV)
 */
struct ColumnNames {
    std::array<std::string, kColumnCount> names;

    ColumnNames() {
        for (Column column : kAllColumns) {
            names[columnIndex(column)] = std::string(defaultColumnName(column));
        }
    }

    [[nodiscard]] const std::string& name(Column column) const noexcept {
        return names[columnIndex(column)];
    }

    void setName(Column column, std::string value) {
        names[columnIndex(column)] = std::move(value);
    }
};

/**
 * @brief Параметры расчёта гидростатического u0 (если колонки нет в файле)
 */
struct HydrostaticSettings {
    UnitWeight gamma_w{9.81};      ///< Удельный вес воды, кН/м³
    Meters water_level{0.0};       ///< Глубина уровня грунтовых вод, м
};

/**
 * @brief Параметры расчёта напряжений
 */
struct StressSettings {
    double area_ratio = 0.8;           ///< Коэффициент площади конуса a
    UnitWeight gamma_soil{18.0};       ///< Удельный вес грунта, кН/м³
    int rolling_window = 1;            ///< Окно сглаживания: 1, 3 или 5
};

/**
 * @brief Параметры итерационного решателя Ic
 */
struct SolverSettings {
    Kilopascals p_ref{100.0};          ///< Опорное давление Pa
    int max_iter = 999;                ///< Предел итераций
    double tolerance = 1e-3;           ///< Порог сходимости по n
    bool secondary_indices = true;     ///< Рассчитывать Cd и Ib
};

/**
 * @brief Параметры очистки от кодов ошибок датчиков
 */
struct CleaningSettings {
    CleaningMode mode = CleaningMode::Remove;
    std::vector<double> indicators{-9999.0, -8888.0, -7777.0};
    double replacement = std::numeric_limits<double>::quiet_NaN();
};

/**
 * @brief Параметры регуляризации глубины
 */
struct DepthAdjustSettings {
    bool enabled = false;
    std::optional<double> start;       ///< По умолчанию - первая глубина
    std::optional<double> spacing;     ///< По умолчанию - средний шаг
};

/**
 * @brief Параметры чтения CSV
 */
struct CsvSettings {
    std::optional<char> delimiter;     ///< nullopt - автоопределение
};

/**
 * @brief Полная конфигурация обработки
 */
struct ConicConfig {
    ColumnNames columns;
    HydrostaticSettings hydrostatic;
    StressSettings stress;
    SolverSettings solver;
    CleaningSettings cleaning;
    DepthAdjustSettings depth_adjustment;
    CsvSettings csv;
};

/**
 * @brief Допустимые длины окна сглаживания
 */
constexpr std::array<int, 3> kAllowedRollingWindows = {1, 3, 5};

} // namespace conic::model

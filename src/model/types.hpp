/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 */

#pragma once

#include "units.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace conic::model {

/**
 * @brief Колонка таблицы зондирования
 *
 * Схема фиксирована: порядок перечисления совпадает с порядком
 * создания колонок в конвейере.
 */
enum class Column {
    Depth,          ///< Глубина, м
    Qc,             ///< Сопротивление под конусом qc, МПа
    Fs,             ///< Трение по муфте fs, кПа
    U2,             ///< Поровое давление за конусом u2, кПа
    U0,             ///< Гидростатическое поровое давление u0, кПа
    SigmaVTot,      ///< Полное вертикальное напряжение σv, кПа
    SigmaVEff,      ///< Эффективное вертикальное напряжение σ'v, кПа
    Qt,             ///< Скорректированное сопротивление qt, МПа
    FsSmoothed,     ///< Сглаженное fs, кПа
    QtSmoothed,     ///< Сглаженное qt, МПа
    Fr,             ///< Нормализованный коэффициент трения, %
    Bq,             ///< Параметр порового давления
    NExponent,      ///< Показатель степени n
    Qtn,            ///< Нормализованное сопротивление Qtn
    Ic,             ///< Индекс типа поведения грунта Ic
    Convergence,    ///< Признак сходимости итераций (три состояния)
    Cd,             ///< Граница контрактивного/дилатантного поведения
    Ib              ///< Модифицированный индекс поведения
};

constexpr size_t kColumnCount = 18;

/**
 * @brief Все колонки в порядке создания
 */
constexpr std::array<Column, kColumnCount> kAllColumns = {
    Column::Depth, Column::Qc, Column::Fs, Column::U2, Column::U0,
    Column::SigmaVTot, Column::SigmaVEff, Column::Qt,
    Column::FsSmoothed, Column::QtSmoothed, Column::Fr, Column::Bq,
    Column::NExponent, Column::Qtn, Column::Ic, Column::Convergence,
    Column::Cd, Column::Ib
};

/**
 * @brief Входные колонки (результат загрузчика)
 */
constexpr std::array<Column, 5> kInputColumns = {
    Column::Depth, Column::Qc, Column::Fs, Column::U2, Column::U0
};

/**
 * @brief Обязательные колонки входного файла (u0 может быть рассчитано)
 */
constexpr std::array<Column, 4> kRequiredInputColumns = {
    Column::Depth, Column::Qc, Column::Fs, Column::U2
};

[[nodiscard]] constexpr size_t columnIndex(Column column) noexcept {
    return static_cast<size_t>(column);
}

/**
 * @brief Состояние сходимости решателя для строки
 *
 * NotApplicable - строка не классифицировалась (Fr < 0 или NaN),
 * это отдельное состояние, а не «не сошлось».
 */
enum class ConvergenceState {
    Converged,
    NotConverged,
    NotApplicable
};

/**
 * @brief Режим очистки строк с кодами ошибок датчиков
 */
enum class CleaningMode {
    Remove,     ///< Удалить строку целиком
    Replace,    ///< Заменить значения (кроме глубины)
    None        ///< Не очищать
};

/**
 * @brief Машинный ключ колонки (используется в конфигурации)
 */
[[nodiscard]] inline std::string_view columnKey(Column column) noexcept {
    switch (column) {
        case Column::Depth: return "depth";
        case Column::Qc: return "qc";
        case Column::Fs: return "fs";
        case Column::U2: return "u2";
        case Column::U0: return "u0";
        case Column::SigmaVTot: return "sigma_v_tot";
        case Column::SigmaVEff: return "sigma_v_eff";
        case Column::Qt: return "qt";
        case Column::FsSmoothed: return "fs_smoothed";
        case Column::QtSmoothed: return "qt_smoothed";
        case Column::Fr: return "fr";
        case Column::Bq: return "bq";
        case Column::NExponent: return "n_exponent";
        case Column::Qtn: return "qtn";
        case Column::Ic: return "ic";
        case Column::Convergence: return "convergence_flag";
        case Column::Cd: return "cd";
        case Column::Ib: return "ib";
    }
    return "";
}

/**
 * @brief Поиск колонки по машинному ключу
 */
[[nodiscard]] inline std::optional<Column> parseColumnKey(std::string_view key) noexcept {
    for (Column column : kAllColumns) {
        if (columnKey(column) == key) {
            return column;
        }
    }
    return std::nullopt;
}

/**
 * @brief Отображаемое имя колонки по умолчанию
 */
[[nodiscard]] inline std::string_view defaultColumnName(Column column) noexcept {
    switch (column) {
        case Column::Depth: return "Depth (m)";
        case Column::Qc: return "qc (MPa)";
        case Column::Fs: return "fs (kPa)";
        case Column::U2: return "u2 (kPa)";
        case Column::U0: return "u0 (kPa)";
        case Column::SigmaVTot: return "σv_tot (kPa)";
        case Column::SigmaVEff: return "σv_eff (kPa)";
        case Column::Qt: return "qt (MPa)";
        case Column::FsSmoothed: return "fs_smoothed (kPa)";
        case Column::QtSmoothed: return "qt_smoothed (MPa)";
        case Column::Fr: return "Fr (%)";
        case Column::Bq: return "Bq (adim.)";
        case Column::NExponent: return "n (adim.)";
        case Column::Qtn: return "Qtn (adim.)";
        case Column::Ic: return "Ic (adim.)";
        case Column::Convergence: return "Convergence";
        case Column::Cd: return "Cd (adim.)";
        case Column::Ib: return "Ib (adim.)";
    }
    return "";
}

[[nodiscard]] inline std::string toString(ConvergenceState state) {
    switch (state) {
        case ConvergenceState::Converged: return "converged";
        case ConvergenceState::NotConverged: return "not_converged";
        case ConvergenceState::NotApplicable: return "not_applicable";
    }
    return "not_applicable";
}

[[nodiscard]] inline std::string toString(CleaningMode mode) {
    switch (mode) {
        case CleaningMode::Remove: return "remove";
        case CleaningMode::Replace: return "replace";
        case CleaningMode::None: return "none";
    }
    return "remove";
}

/**
 * @brief Парсинг CleaningMode из строки
 * @return nullopt для неизвестного значения (ошибка конфигурации)
 */
[[nodiscard]] inline std::optional<CleaningMode> parseCleaningMode(std::string_view str) noexcept {
    if (str == "remove") return CleaningMode::Remove;
    if (str == "replace") return CleaningMode::Replace;
    if (str == "none") return CleaningMode::None;
    return std::nullopt;
}

} // namespace conic::model

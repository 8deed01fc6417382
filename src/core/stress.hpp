/**
 * @file stress.hpp
 * @brief Расчёт напряжений и нормализованных параметров
 *
 * Формулы построчные, строки независимы (кроме окна сглаживания):
 *   σv_tot = γ·z
 *   σv_eff = σv_tot - u0
 *   qt     = qc + (1 - a)·u2 / 1000           [МПа]
 *   Fr     = fs_s / (qt_s·1000 - σv_tot)·100  [%]
 *   Bq     = (u2 - u0) / (qt_s·1000 - σv_tot)
 * где fs_s, qt_s - скользящие средние по окну W (при W = 1 - исходные ряды).
 *
 * Деление на ноль и отрицательные знаменатели не обрабатываются особо:
 * результатом будет ±inf или NaN.
 */

#pragma once

#include "model/config.hpp"
#include "model/sounding_table.hpp"

namespace conic::core {

using namespace conic::model;

/**
 * @brief Скорректированное сопротивление qt, МПа
 *
 * @param qc Сопротивление под конусом, МПа
 * @param u2 Поровое давление за конусом, кПа
 * @param area_ratio Коэффициент площади конуса
 */
[[nodiscard]] inline double correctedResistance(double qc, double u2, double area_ratio) noexcept {
    return qc + (1.0 - area_ratio) * u2 / 1000.0;
}

/**
 * @brief Нормализованный коэффициент трения Fr, %
 */
[[nodiscard]] inline double frictionRatio(double fs, double qt_mpa, double sigma_v_tot) noexcept {
    return fs / (qt_mpa * 1000.0 - sigma_v_tot) * 100.0;
}

/**
 * @brief Параметр порового давления Bq
 */
[[nodiscard]] inline double porePressureRatio(
    double u2, double u0, double qt_mpa, double sigma_v_tot
) noexcept {
    return (u2 - u0) / (qt_mpa * 1000.0 - sigma_v_tot);
}

/**
 * @brief Гидростатическое поровое давление u0, кПа
 *
 * γw·(z - zw) ниже уровня грунтовых вод, 0 выше. NaN глубина даёт NaN.
 */
[[nodiscard]] inline double hydrostaticPressure(
    double depth, const HydrostaticSettings& settings
) noexcept {
    if (depth < settings.water_level.value) {
        return 0.0;
    }
    return (settings.gamma_w * (Meters{depth} - settings.water_level)).value;
}

/**
 * @brief Добавить расчётную колонку u0 по глубине
 *
 * Используется загрузчиком, когда u0 нет во входном файле.
 *
 * @throws SchemaError Если нет колонки глубины
 */
[[nodiscard]] SoundingTable addHydrostaticPressure(
    const SoundingTable& table,
    const HydrostaticSettings& settings
);

/**
 * @brief Добавить колонки напряжений
 *
 * Требует depth, qc, fs, u2, u0. Добавляет sigma_v_tot, sigma_v_eff, qt,
 * при W > 1 также fs_smoothed и qt_smoothed, затем Fr и Bq.
 *
 * @throws SchemaError Если нет входных колонок
 * @throws InvalidDataError Для некорректного окна сглаживания
 */
[[nodiscard]] SoundingTable addStressColumns(
    const SoundingTable& table,
    const StressSettings& settings
);

} // namespace conic::core

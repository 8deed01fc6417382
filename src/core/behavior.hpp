/**
 * @file behavior.hpp
 * @brief Итерационный расчёт индекса типа поведения грунта Ic
 *
 * Для каждой строки, начиная с n₀ = 1:
 *   Qtn_k   = ((qt - σv_tot) / Pa) · (Pa / σ'v)^n_k
 *   Ic_k    = √((3.47 - lg Qtn_k)² + (lg Fr + 1.22)²)
 *   n_(k+1) = min(1, 0.381·Ic_k + 0.05·(σ'v / Pa) - 0.15)
 * Не более max_iter - 1 шагов. Сходимость проверяется по кандидату:
 * |n_(k+1) - n_k| ≤ tolerance. Кандидат принимается на каждом шаге.
 * Итоговые Qtn и Ic пересчитываются по последнему принятому n.
 *
 * qt здесь в кПа (в таблице - МПа).
 */

#pragma once

#include "model/config.hpp"
#include "model/sounding_table.hpp"

namespace conic::core {

using namespace conic::model;

/**
 * @brief Входные величины одной строки
 */
struct BehaviorInput {
    double qt_kpa;          ///< Скорректированное сопротивление, кПа
    double sigma_v_tot;     ///< Полное вертикальное напряжение, кПа
    double sigma_v_eff;     ///< Эффективное вертикальное напряжение, кПа
    double fr;              ///< Нормализованный коэффициент трения, %
};

/**
 * @brief Результат решения для одной строки
 */
struct BehaviorSolution {
    double n;
    double qtn;
    double ic;
    ConvergenceState state;
    int steps = 0;          ///< Выполнено шагов итерации
};

/**
 * @brief Нормализованное сопротивление Qtn
 */
[[nodiscard]] double calculateQtn(
    double n, double qt_kpa, double sigma_v_eff, double sigma_v_tot, double p_ref
) noexcept;

/**
 * @brief Индекс типа поведения Ic
 */
[[nodiscard]] double calculateIc(double qtn, double fr) noexcept;

/**
 * @brief Следующее приближение показателя степени n (не больше 1)
 */
[[nodiscard]] double calculateStressExponent(double ic, double sigma_v_eff, double p_ref) noexcept;

/**
 * @brief Граница контрактивного/дилатантного поведения Cd
 */
[[nodiscard]] double calculateCd(double qtn, double fr) noexcept;

/**
 * @brief Модифицированный индекс поведения Ib
 */
[[nodiscard]] double calculateIb(double qtn, double fr) noexcept;

/**
 * @brief Решить одну строку
 *
 * При Fr < 0 или Fr = NaN итерации не выполняются: n, Qtn, Ic = NaN,
 * состояние NotApplicable.
 */
[[nodiscard]] BehaviorSolution solveBehavior(
    const BehaviorInput& input,
    const SolverSettings& settings
) noexcept;

/**
 * @brief Добавить колонки n_exponent, Qtn, Ic, convergence_flag
 *        и (если secondary_indices) Cd, Ib
 *
 * @throws SchemaError Если нет sigma_v_tot, sigma_v_eff, qt или Fr
 */
[[nodiscard]] SoundingTable addBehaviorColumns(
    const SoundingTable& table,
    const SolverSettings& settings,
    bool secondary_indices
);

} // namespace conic::core

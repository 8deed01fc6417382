/**
 * @file behavior.cpp
 * @brief Реализация решателя Ic
 */

#include "behavior.hpp"
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace conic::core {

namespace {

constexpr double kNan = std::numeric_limits<double>::quiet_NaN();

} // namespace

double calculateQtn(
    double n, double qt_kpa, double sigma_v_eff, double sigma_v_tot, double p_ref
) noexcept {
    const double cn = std::pow(p_ref / sigma_v_eff, n);
    const double qt_term = (qt_kpa - sigma_v_tot) / p_ref;
    return qt_term * cn;
}

double calculateIc(double qtn, double fr) noexcept {
    const double fr_term = std::log10(fr) + 1.22;
    const double qtn_term = 3.47 - std::log10(qtn);
    return std::sqrt(fr_term * fr_term + qtn_term * qtn_term);
}

double calculateStressExponent(double ic, double sigma_v_eff, double p_ref) noexcept {
    // fmin: при NaN в первом аргументе результат 1.0
    return std::fmin(0.381 * ic + 0.05 * (sigma_v_eff / p_ref) - 0.15, 1.0);
}

double calculateCd(double qtn, double fr) noexcept {
    return (qtn - 11.0) * std::pow(1.0 + 0.06 * fr, 17.0);
}

double calculateIb(double qtn, double fr) noexcept {
    return 100.0 * (qtn + 10.0) / (70.0 + qtn * fr);
}

BehaviorSolution solveBehavior(
    const BehaviorInput& input,
    const SolverSettings& settings
) noexcept {
    if (std::isnan(input.fr) || input.fr < 0.0) {
        return {kNan, kNan, kNan, ConvergenceState::NotApplicable, 0};
    }

    const double p_ref = settings.p_ref.value;
    double n = 1.0;
    bool converged = false;
    int steps = 0;

    // Проверка сходимости использует n_(k+1), поэтому шагов на один меньше
    for (int k = 0; k + 1 < settings.max_iter; ++k) {
        const double qtn = calculateQtn(n, input.qt_kpa, input.sigma_v_eff, input.sigma_v_tot, p_ref);
        const double ic = calculateIc(qtn, input.fr);
        const double n_next = calculateStressExponent(ic, input.sigma_v_eff, p_ref);

        converged = std::abs(n_next - n) <= settings.tolerance;
        n = n_next;
        ++steps;

        if (converged) break;
    }

    const double qtn = calculateQtn(n, input.qt_kpa, input.sigma_v_eff, input.sigma_v_tot, p_ref);
    const double ic = calculateIc(qtn, input.fr);

    return {
        n, qtn, ic,
        converged ? ConvergenceState::Converged : ConvergenceState::NotConverged,
        steps
    };
}

SoundingTable addBehaviorColumns(
    const SoundingTable& table,
    const SolverSettings& settings,
    bool secondary_indices
) {
    requireColumns(table,
        {Column::SigmaVTot, Column::SigmaVEff, Column::Qt, Column::Fr},
        "Расчёт индекса Ic");

    const auto& sigma_v_tot = table.values(Column::SigmaVTot);
    const auto& sigma_v_eff = table.values(Column::SigmaVEff);
    const auto& qt = table.values(Column::Qt);
    const auto& fr = table.values(Column::Fr);

    const size_t n_rows = table.rowCount();
    std::vector<double> n_values(n_rows);
    std::vector<double> qtn_values(n_rows);
    std::vector<double> ic_values(n_rows);
    std::vector<ConvergenceState> states(n_rows);

    #ifdef CONIC_USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < n_rows; ++i) {
        const BehaviorInput input{
            Megapascals{qt[i]}.toKilopascals().value,
            sigma_v_tot[i],
            sigma_v_eff[i],
            fr[i]
        };
        const auto solution = solveBehavior(input, settings);
        n_values[i] = solution.n;
        qtn_values[i] = solution.qtn;
        ic_values[i] = solution.ic;
        states[i] = solution.state;
    }

    SoundingTable result = table;
    result.setColumn(Column::NExponent, std::move(n_values));
    result.setColumn(Column::Qtn, qtn_values);
    result.setColumn(Column::Ic, std::move(ic_values));
    result.setConvergence(states);

    if (secondary_indices) {
        std::vector<double> cd(n_rows);
        std::vector<double> ib(n_rows);
        for (size_t i = 0; i < n_rows; ++i) {
            if (states[i] == ConvergenceState::NotApplicable) {
                cd[i] = kNan;
                ib[i] = kNan;
                continue;
            }
            cd[i] = calculateCd(qtn_values[i], fr[i]);
            ib[i] = calculateIb(qtn_values[i], fr[i]);
        }
        result.setColumn(Column::Cd, std::move(cd));
        result.setColumn(Column::Ib, std::move(ib));
    }

    return result;
}

} // namespace conic::core

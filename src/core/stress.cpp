/**
 * @file stress.cpp
 * @brief Реализация расчёта напряжений
 */

#include "stress.hpp"
#include "rolling.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace conic::core {

SoundingTable addHydrostaticPressure(
    const SoundingTable& table,
    const HydrostaticSettings& settings
) {
    requireColumns(table, {Column::Depth}, "Расчёт u0");

    const auto& depth = table.values(Column::Depth);
    std::vector<double> u0(depth.size());
    for (size_t i = 0; i < depth.size(); ++i) {
        u0[i] = hydrostaticPressure(depth[i], settings);
    }
    return table.withColumn(Column::U0, std::move(u0));
}

SoundingTable addStressColumns(
    const SoundingTable& table,
    const StressSettings& settings
) {
    requireColumns(table,
        {Column::Depth, Column::Qc, Column::Fs, Column::U2, Column::U0},
        "Расчёт напряжений");

    const int window = settings.rolling_window;
    if (std::find(kAllowedRollingWindows.begin(), kAllowedRollingWindows.end(), window) ==
        kAllowedRollingWindows.end()) {
        throw InvalidDataError(
            "Недопустимое окно сглаживания " + std::to_string(window) + " (допустимо: 1, 3, 5)"
        );
    }

    const auto& depth = table.values(Column::Depth);
    const auto& qc = table.values(Column::Qc);
    const auto& fs = table.values(Column::Fs);
    const auto& u2 = table.values(Column::U2);
    const auto& u0 = table.values(Column::U0);

    const size_t n = table.rowCount();
    const double area_ratio = settings.area_ratio;

    std::vector<double> sigma_v_tot(n);
    std::vector<double> sigma_v_eff(n);
    std::vector<double> qt(n);

    #ifdef CONIC_USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t i = 0; i < n; ++i) {
        sigma_v_tot[i] = (settings.gamma_soil * Meters{depth[i]}).value;
        sigma_v_eff[i] = sigma_v_tot[i] - u0[i];
        qt[i] = correctedResistance(qc[i], u2[i], area_ratio);
    }

    std::vector<double> fs_smoothed = rollingMean(fs, window);
    std::vector<double> qt_smoothed = rollingMean(qt, window);

    std::vector<double> fr(n);
    std::vector<double> bq(n);

    #ifdef CONIC_USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t i = 0; i < n; ++i) {
        fr[i] = frictionRatio(fs_smoothed[i], qt_smoothed[i], sigma_v_tot[i]);
        bq[i] = porePressureRatio(u2[i], u0[i], qt_smoothed[i], sigma_v_tot[i]);
    }

    SoundingTable result = table;
    result.setColumn(Column::SigmaVTot, std::move(sigma_v_tot));
    result.setColumn(Column::SigmaVEff, std::move(sigma_v_eff));
    result.setColumn(Column::Qt, std::move(qt));
    if (window > 1) {
        result.setColumn(Column::FsSmoothed, std::move(fs_smoothed));
        result.setColumn(Column::QtSmoothed, std::move(qt_smoothed));
    }
    result.setColumn(Column::Fr, std::move(fr));
    result.setColumn(Column::Bq, std::move(bq));
    return result;
}

} // namespace conic::core

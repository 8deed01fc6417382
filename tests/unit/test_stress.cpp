/**
 * @file test_stress.cpp
 * @brief Проверка расчёта напряжений
 */

#include <doctest/doctest.h>
#include "core/stress.hpp"
#include "model/errors.hpp"
#include <cmath>

using namespace conic::model;
using namespace conic::core;

namespace {

SoundingTable makeInputTable() {
    SoundingTable table;
    table.setColumn(Column::Depth, {1.0, 2.0, 3.0, 4.0, 5.0});
    table.setColumn(Column::Qc, {2.0, 2.2, 2.4, 2.6, 2.8});
    table.setColumn(Column::Fs, {20.0, 22.0, 24.0, 26.0, 28.0});
    table.setColumn(Column::U2, {50.0, 60.0, 70.0, 80.0, 90.0});
    table.setColumn(Column::U0, {9.81, 19.62, 29.43, 39.24, 49.05});
    return table;
}

} // namespace

TEST_CASE("stress formulas for a single row") {
    auto table = addStressColumns(makeInputTable(), StressSettings{});

    CHECK(table.value(Column::SigmaVTot, 0) == doctest::Approx(18.0));
    CHECK(table.value(Column::SigmaVEff, 0) == doctest::Approx(8.19));
    CHECK(table.value(Column::Qt, 0) == doctest::Approx(2.01));
    CHECK(table.value(Column::Fr, 0) == doctest::Approx(20.0 / 1992.0 * 100.0));
    CHECK(table.value(Column::Bq, 0) == doctest::Approx((50.0 - 9.81) / 1992.0));
}

TEST_CASE("effective stress equals total stress minus u0 for every row") {
    auto input = makeInputTable();
    auto table = addStressColumns(input, StressSettings{});

    const auto& total = table.values(Column::SigmaVTot);
    const auto& effective = table.values(Column::SigmaVEff);
    const auto& u0 = input.values(Column::U0);
    for (size_t i = 0; i < table.rowCount(); ++i) {
        CHECK(std::abs(effective[i] - (total[i] - u0[i])) < 1e-9);
    }
}

TEST_CASE("column order without smoothing") {
    auto table = addStressColumns(makeInputTable(), StressSettings{});

    const std::vector<Column> expected{
        Column::Depth, Column::Qc, Column::Fs, Column::U2, Column::U0,
        Column::SigmaVTot, Column::SigmaVEff, Column::Qt, Column::Fr, Column::Bq
    };
    CHECK(table.columns() == expected);
    CHECK_FALSE(table.hasColumn(Column::FsSmoothed));
}

TEST_CASE("smoothing window 3 adds smoothed columns and NaN edges") {
    StressSettings settings;
    settings.rolling_window = 3;
    auto table = addStressColumns(makeInputTable(), settings);

    REQUIRE(table.hasColumn(Column::FsSmoothed));
    REQUIRE(table.hasColumn(Column::QtSmoothed));
    CHECK(table.columns()[8] == Column::FsSmoothed);
    CHECK(table.columns()[9] == Column::QtSmoothed);

    CHECK(std::isnan(table.value(Column::Fr, 0)));
    CHECK(std::isnan(table.value(Column::Bq, 4)));
    CHECK(table.value(Column::FsSmoothed, 1) == doctest::Approx(22.0));

    const double qt_s = table.value(Column::QtSmoothed, 1);
    CHECK(qt_s == doctest::Approx((2.01 + 2.212 + 2.414) / 3.0));
    CHECK(table.value(Column::Fr, 1) == doctest::Approx(22.0 / (qt_s * 1000.0 - 36.0) * 100.0));
}

TEST_CASE("smoothing window outside 1, 3, 5 is rejected") {
    StressSettings settings;
    settings.rolling_window = 7;
    CHECK_THROWS_AS((void)addStressColumns(makeInputTable(), settings), InvalidDataError);

    settings.rolling_window = 0;
    CHECK_THROWS_AS((void)addStressColumns(makeInputTable(), settings), InvalidDataError);
}

TEST_CASE("zero denominator propagates infinity") {
    SoundingTable input;
    input.setColumn(Column::Depth, {50.0});
    input.setColumn(Column::Qc, {1.0});
    input.setColumn(Column::Fs, {5.0});
    input.setColumn(Column::U2, {0.0});
    input.setColumn(Column::U0, {0.0});

    StressSettings settings;
    settings.gamma_soil = UnitWeight{20.0};
    auto table = addStressColumns(input, settings);
    CHECK(std::isinf(table.value(Column::Fr, 0)));
    CHECK(std::isnan(table.value(Column::Bq, 0)));
}

TEST_CASE("missing input columns are all reported") {
    SoundingTable input;
    input.setColumn(Column::Depth, {1.0});
    input.setColumn(Column::Qc, {1.0});

    try {
        (void)addStressColumns(input, StressSettings{});
        FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
        CHECK(e.missingColumns().size() == 3);
    }
}

TEST_CASE("hydrostatic pressure below and above the water level") {
    HydrostaticSettings settings;
    settings.water_level = Meters{2.0};

    CHECK(hydrostaticPressure(1.0, settings) == doctest::Approx(0.0));
    CHECK(hydrostaticPressure(2.0, settings) == doctest::Approx(0.0));
    CHECK(hydrostaticPressure(5.0, settings) == doctest::Approx(3.0 * 9.81));
}

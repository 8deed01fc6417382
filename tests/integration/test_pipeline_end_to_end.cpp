/**
 * @file test_pipeline_end_to_end.cpp
 * @brief Интеграционный тест полной обработки
 */

#include <doctest/doctest.h>
#include "core/pipeline.hpp"
#include "io/config_io.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/summary_writer.hpp"
#include "model/errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace conic::model;
using namespace conic::core;
using namespace conic::io;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(CONIC_SOURCE_DIR) / "tests" / "fixtures" / name;
}

SoundingTable loadFixture(const std::string& name, const ConicConfig& config) {
    CsvReadOptions options;
    options.delimiter = config.csv.delimiter;
    return readSoundingCsv(fixturePath(name), options, config.columns, config.hydrostatic);
}

} // namespace

TEST_CASE("sentinel row is removed and remaining rows are classified") {
    const ConicConfig config;
    const auto raw = loadFixture("sounding_sentinel.csv", config);
    REQUIRE(raw.rowCount() == 5);

    auto result = runPipeline(raw, config);
    const auto& table = result.table;

    REQUIRE(table.rowCount() == 4);
    CHECK(result.summary.rows_read == 5);
    CHECK(result.summary.rows_removed == 1);
    CHECK(table.value(Column::Depth, 2) == doctest::Approx(1.06));

    for (size_t i = 0; i < table.rowCount(); ++i) {
        CHECK(std::isfinite(table.value(Column::Fr, i)));
        CHECK(std::isfinite(table.value(Column::Bq, i)));
        CHECK(table.convergence()[i] == ConvergenceState::Converged);
    }
    CHECK(result.summary.converged == 4);
    CHECK(result.warnings.empty());

    CHECK(table.value(Column::Fr, 0) == doctest::Approx(1.2647555).epsilon(1e-6));
    CHECK(table.value(Column::Ic, 0) == doctest::Approx(2.2771448).epsilon(1e-6));
    CHECK(table.value(Column::Ic, 3) == doctest::Approx(2.2565585).epsilon(1e-6));
}

TEST_CASE("pipeline leaves the loaded table untouched") {
    const ConicConfig config;
    const auto raw = loadFixture("sounding_sentinel.csv", config);
    const auto copy = raw;

    (void)runPipeline(raw, config);
    CHECK(raw.identicalTo(copy));
}

TEST_CASE("replace mode with smoothing, depth adjustment and synthesized u0") {
    const auto config = loadConfig(fixturePath("conic_replace.json"));
    const auto raw = loadFixture("sounding_no_u0.csv", config);
    REQUIRE(raw.rowCount() == 6);
    CHECK(raw.value(Column::U0, 0) == doctest::Approx(0.0));
    CHECK(raw.value(Column::U0, 1) == doctest::Approx(0.0));
    CHECK(raw.value(Column::U0, 3) == doctest::Approx(9.81 * 0.8));

    std::vector<double> progress;
    auto result = runPipeline(raw, config, [&progress](double p, std::string_view) {
        progress.push_back(p);
    });
    const auto& table = result.table;

    REQUIRE(table.rowCount() == 6);
    CHECK(result.summary.rows_replaced == 1);
    REQUIRE(result.summary.depth_spacing.has_value());
    CHECK(*result.summary.depth_spacing == doctest::Approx(0.5));
    CHECK(table.value(Column::Depth, 2) == doctest::Approx(1.5));
    CHECK(std::isnan(table.value(Column::Qc, 2)));
    CHECK(std::isnan(table.value(Column::Fs, 2)));

    REQUIRE(table.hasColumn(Column::FsSmoothed));
    CHECK(std::isnan(table.value(Column::Fr, 0)));
    CHECK(std::isnan(table.value(Column::Fr, 5)));
    CHECK(table.convergence()[0] == ConvergenceState::NotApplicable);
    CHECK(table.convergence()[5] == ConvergenceState::NotApplicable);

    REQUIRE_FALSE(progress.empty());
    CHECK(progress.front() == doctest::Approx(0.0));
    CHECK(progress.back() == doctest::Approx(1.0));
    CHECK(std::is_sorted(progress.begin(), progress.end()));
}

TEST_CASE("invalid configuration stops the pipeline before processing") {
    ConicConfig config;
    config.stress.rolling_window = 7;
    const auto raw = loadFixture("sounding_sentinel.csv", ConicConfig{});

    int progress_calls = 0;
    CHECK_THROWS_AS(
        (void)runPipeline(raw, config, [&progress_calls](double, std::string_view) {
            ++progress_calls;
        }),
        ConfigError
    );
    CHECK(progress_calls == 0);
}

TEST_CASE("reported depth spacing is the rounded step") {
    ConicConfig config;
    config.depth_adjustment.enabled = true;
    const auto raw = loadFixture("sounding_sentinel.csv", config);

    SUBCASE("supplied spacing") {
        config.depth_adjustment.start = 1.2;
        config.depth_adjustment.spacing = 0.1;
        const auto result = runPipeline(raw, config);
        REQUIRE(result.summary.depth_spacing.has_value());
        CHECK(*result.summary.depth_spacing == 0.1);
        CHECK(result.table.value(Column::Depth, 3) == doctest::Approx(1.5));
    }

    SUBCASE("inferred spacing") {
        // После удаления строки 1.04 разности 0.02, 0.04, 0.02
        const auto result = runPipeline(raw, config);
        REQUIRE(result.summary.depth_spacing.has_value());
        CHECK(*result.summary.depth_spacing == 0.027);
    }
}

TEST_CASE("summary JSON reflects the run") {
    const ConicConfig config;
    const auto raw = loadFixture("sounding_sentinel.csv", config);
    const auto result = runPipeline(raw, config);

    RunMeta meta;
    meta.app_version = "test";
    meta.input_path = "sounding_sentinel.csv";
    meta.timestamp = "2024-01-01T00:00:00";

    const auto j = nlohmann::json::parse(formatRunSummary(result, config, meta));
    CHECK(j["meta"]["app_version"] == "test");
    CHECK(j["rows"]["read"] == 5);
    CHECK(j["rows"]["removed"] == 1);
    CHECK(j["convergence"]["converged"] == 4);
    CHECK(j["depth_spacing"].is_null());
    CHECK(j["columns"]["ic"]["finite"] == 4);
    CHECK(j["config"]["cleaning"]["mode"] == "remove");
}

TEST_CASE("processed table exports to CSV") {
    namespace fs = std::filesystem;
    const ConicConfig config;
    const auto result = runPipeline(loadFixture("sounding_sentinel.csv", config), config);

    auto path = fs::temp_directory_path() / "conic_end_to_end.csv";
    std::error_code ec;
    fs::remove(path, ec);
    writeSoundingCsv(result.table, config.columns, path);

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    CHECK(header.rfind("Depth (m),qc (MPa),fs (kPa),u2 (kPa),u0 (kPa),σv_tot (kPa)", 0) == 0);
    CHECK(header.find("Convergence,Cd (adim.),Ib (adim.)") != std::string::npos);

    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lines;
        CHECK(line.find(",converged,") != std::string::npos);
    }
    CHECK(lines == 4);

    in.close();
    fs::remove(path, ec);
}

/**
 * @file test_config_io.cpp
 * @brief Проверка чтения конфигурации и её валидации
 */

#include <doctest/doctest.h>
#include "io/config_io.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace conic::io;
using namespace conic::model;

TEST_CASE("empty object keeps defaults") {
    auto config = configFromJson("{}");

    CHECK(config.stress.area_ratio == doctest::Approx(0.8));
    CHECK(config.stress.gamma_soil.value == doctest::Approx(18.0));
    CHECK(config.hydrostatic.gamma_w.value == doctest::Approx(9.81));
    CHECK(config.hydrostatic.water_level.value == doctest::Approx(0.0));
    CHECK(config.stress.rolling_window == 1);
    CHECK(config.solver.p_ref.value == doctest::Approx(100.0));
    CHECK(config.solver.max_iter == 999);
    CHECK(config.solver.tolerance == doctest::Approx(1e-3));
    CHECK(config.cleaning.mode == CleaningMode::Remove);
    CHECK(config.cleaning.indicators.size() == 3);
    CHECK(std::isnan(config.cleaning.replacement));
    CHECK_FALSE(config.depth_adjustment.enabled);
    CHECK_FALSE(config.csv.delimiter.has_value());
    CHECK(config.columns.name(Column::Depth) == "Depth (m)");
    CHECK(validateConfig(config).is_valid);
}

TEST_CASE("all sections are read") {
    const std::string text = R"({
        "columns": {
            "input": { "depth": "z", "qc": "cone" },
            "output": { "ic": "Ic" }
        },
        "cone": { "area_ratio": 0.75 },
        "soil": { "gamma_soil": 19.5, "gamma_w": 10.0, "water_level": 1.5 },
        "smoothing": { "rolling_window": 5 },
        "solver": { "p_ref": 101.3, "max_iter": 50, "tolerance": 0.0001, "secondary_indices": false },
        "cleaning": { "mode": "replace", "indicators": [-1, -2], "replacement": 0.0 },
        "depth_adjustment": { "enabled": true, "start": 0.0, "spacing": 0.02 },
        "csv": { "delimiter": "\\t" }
    })";

    auto config = configFromJson(text);
    CHECK(config.columns.name(Column::Depth) == "z");
    CHECK(config.columns.name(Column::Qc) == "cone");
    CHECK(config.columns.name(Column::Fs) == "fs (kPa)");
    CHECK(config.columns.name(Column::Ic) == "Ic");
    CHECK(config.stress.area_ratio == doctest::Approx(0.75));
    CHECK(config.stress.gamma_soil.value == doctest::Approx(19.5));
    CHECK(config.hydrostatic.water_level.value == doctest::Approx(1.5));
    CHECK(config.stress.rolling_window == 5);
    CHECK(config.solver.max_iter == 50);
    CHECK_FALSE(config.solver.secondary_indices);
    CHECK(config.cleaning.mode == CleaningMode::Replace);
    CHECK(config.cleaning.indicators == std::vector<double>{-1.0, -2.0});
    CHECK(config.cleaning.replacement == doctest::Approx(0.0));
    CHECK(config.depth_adjustment.enabled);
    REQUIRE(config.depth_adjustment.spacing.has_value());
    CHECK(*config.depth_adjustment.spacing == doctest::Approx(0.02));
    REQUIRE(config.csv.delimiter.has_value());
    CHECK(*config.csv.delimiter == '\t');
}

TEST_CASE("serialized config reads back unchanged") {
    ConicConfig config;
    config.stress.rolling_window = 3;
    config.cleaning.mode = CleaningMode::None;
    config.depth_adjustment.spacing = 0.05;
    config.columns.setName(Column::Fr, "Rf (%)");

    auto restored = configFromJson(configToJson(config));
    CHECK(restored.stress.rolling_window == 3);
    CHECK(restored.cleaning.mode == CleaningMode::None);
    CHECK(std::isnan(restored.cleaning.replacement));
    REQUIRE(restored.depth_adjustment.spacing.has_value());
    CHECK(*restored.depth_adjustment.spacing == doctest::Approx(0.05));
    CHECK_FALSE(restored.depth_adjustment.start.has_value());
    CHECK(restored.columns.name(Column::Fr) == "Rf (%)");
}

TEST_CASE("malformed configuration raises ConfigError") {
    CHECK_THROWS_AS((void)configFromJson("{ not json"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"solver": {"max_iter": "many"}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"cleaning": {"mode": "drop"}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"columns": {"input": {"qtn": "x"}}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"columns": {"output": {"unknown": "x"}}})"), ConfigError);
    CHECK_THROWS_AS((void)configFromJson(R"({"csv": {"delimiter": ";;"}})"), ConfigError);
}

TEST_CASE("validation collects every violation") {
    ConicConfig config;
    config.stress.rolling_window = 2;
    config.stress.gamma_soil = UnitWeight{0.0};
    config.solver.max_iter = 0;
    config.solver.tolerance = -1.0;
    config.solver.p_ref = Kilopascals{-100.0};

    auto result = validateConfig(config);
    CHECK_FALSE(result.is_valid);
    CHECK(result.errors.size() == 5);
}

TEST_CASE("validation rejects duplicate input column names") {
    ConicConfig config;
    config.columns.setName(Column::Fs, "qc (MPa)");
    auto result = validateConfig(config);
    CHECK_FALSE(result.is_valid);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].type == ValidationErrorType::DuplicateName);
}

TEST_CASE("unusual area ratio is a warning, not an error") {
    ConicConfig config;
    config.stress.area_ratio = 1.2;
    auto result = validateConfig(config);
    CHECK(result.is_valid);
    CHECK(result.hasWarnings());
}

TEST_CASE("loadConfig validates the file") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "conic_invalid_config.json";
    {
        std::ofstream out(path);
        out << R"({"smoothing": {"rolling_window": 4}, "solver": {"max_iter": -3}})";
    }

    try {
        (void)loadConfig(path);
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        const std::string message = e.what();
        CHECK(message.find("rolling_window") != std::string::npos);
        CHECK(message.find("max_iter") != std::string::npos);
    }

    std::error_code ec;
    fs::remove(path, ec);
    CHECK_THROWS_AS((void)loadConfig(path), IoError);
}

TEST_CASE("table validation warns about decreasing depth") {
    SoundingTable table;
    table.setColumn(Column::Depth, {1.0, 2.0, 1.5, 1.5});
    auto result = validateSoundingTable(table);
    CHECK(result.is_valid);
    REQUIRE(result.warnings.size() == 2);
}

TEST_CASE("bundled conic.json matches built-in defaults") {
    const auto path = std::filesystem::path(CONIC_SOURCE_DIR) / "conic.json";
    auto config = loadConfig(path);
    ConicConfig defaults;

    for (Column column : kAllColumns) {
        CHECK(config.columns.name(column) == defaults.columns.name(column));
    }
    CHECK(config.cleaning.mode == CleaningMode::Remove);
    CHECK(config.cleaning.indicators == defaults.cleaning.indicators);
    CHECK(std::isnan(config.cleaning.replacement));
    CHECK(config.solver.max_iter == defaults.solver.max_iter);
    CHECK_FALSE(config.depth_adjustment.enabled);
    CHECK_FALSE(config.csv.delimiter.has_value());
}

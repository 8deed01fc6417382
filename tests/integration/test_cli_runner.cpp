/**
 * @file test_cli_runner.cpp
 * @brief Интеграционный тест командной строки
 */

#include <doctest/doctest.h>
#include "app/runner.hpp"
#include "model/errors.hpp"
#include <filesystem>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace conic::app;
using namespace conic::model;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(CONIC_SOURCE_DIR) / "tests" / "fixtures" / name;
}

} // namespace

TEST_CASE("command line parsing") {
    SUBCASE("full set of options") {
        const char* argv[] = {
            "conic", "--input", "in.csv", "--output", "out.csv", "--head", "3",
            "--replace", "--adjust-depth", "--spacing", "0.02", "--window", "5",
            "--delimiter", "tab"
        };
        auto options = parseCommandLine(static_cast<int>(std::size(argv)), argv);
        CHECK(options.input == "in.csv");
        REQUIRE(options.output.has_value());
        CHECK(*options.output == "out.csv");
        CHECK(options.head == 3);
        CHECK(options.cleaning_mode == CleaningMode::Replace);
        CHECK(options.adjust_depth);
        CHECK(options.spacing == 0.02);
        CHECK(options.window == 5);
        CHECK(options.delimiter == '\t');

        auto config = buildConfig(options);
        CHECK(config.cleaning.mode == CleaningMode::Replace);
        CHECK(config.depth_adjustment.enabled);
        CHECK(config.stress.rolling_window == 5);
    }

    SUBCASE("input is required") {
        const char* argv[] = {"conic", "--head", "3"};
        CHECK_THROWS_AS((void)parseCommandLine(3, argv), std::invalid_argument);
    }

    SUBCASE("unknown option") {
        const char* argv[] = {"conic", "--input", "a.csv", "--fast"};
        CHECK_THROWS_AS((void)parseCommandLine(4, argv), std::invalid_argument);
    }

    SUBCASE("missing value") {
        const char* argv[] = {"conic", "--input"};
        CHECK_THROWS_AS((void)parseCommandLine(2, argv), std::invalid_argument);
    }

    SUBCASE("negative preview row count") {
        const char* argv[] = {"conic", "--input", "a.csv", "--head", "-1"};
        CHECK_THROWS_AS((void)parseCommandLine(5, argv), std::invalid_argument);
    }

    SUBCASE("trailing characters in numbers") {
        const char* window[] = {"conic", "--input", "a.csv", "--window", "3abc"};
        CHECK_THROWS_AS((void)parseCommandLine(5, window), std::invalid_argument);

        const char* head[] = {"conic", "--input", "a.csv", "--head", "8rows"};
        CHECK_THROWS_AS((void)parseCommandLine(5, head), std::invalid_argument);

        const char* spacing[] = {"conic", "--input", "a.csv", "--adjust-depth", "--spacing", "0.1m"};
        CHECK_THROWS_AS((void)parseCommandLine(6, spacing), std::invalid_argument);
    }

    SUBCASE("spacing without depth adjustment") {
        const char* argv[] = {"conic", "--input", "a.csv", "--spacing", "0.1"};
        CHECK_THROWS_AS((void)parseCommandLine(5, argv), std::invalid_argument);
    }
}

TEST_CASE("invalid window from the command line is a configuration error") {
    CommandOptions options;
    options.input = fixturePath("sounding_sentinel.csv");
    options.window = 4;
    CHECK_THROWS_AS((void)buildConfig(options), ConfigError);
}

TEST_CASE("runCommand processes a file and writes outputs") {
    namespace fs = std::filesystem;
    const auto out_dir = fs::temp_directory_path() / "conic_cli_test";
    std::error_code ec;
    fs::remove_all(out_dir, ec);

    CommandOptions options;
    options.input = fixturePath("sounding_sentinel.csv");
    options.output = out_dir / "result.csv";
    options.summary = out_dir / "summary.json";
    options.head = 2;

    std::ostringstream out;
    std::ostringstream err;
    auto result = runCommand(options, out, err);

    CHECK(result.exit_code == 0);
    CHECK(result.pipeline.table.rowCount() == 4);
    CHECK(fs::exists(out_dir / "result.csv"));
    CHECK(fs::exists(out_dir / "summary.json"));
    CHECK(out.str().find("Прочитано строк: 5") != std::string::npos);
    CHECK(out.str().find("Удалено строк: 1") != std::string::npos);
    CHECK(err.str().empty());

    fs::remove_all(out_dir, ec);
}

TEST_CASE("runCommand reports missing input file as IoError") {
    CommandOptions options;
    options.input = fixturePath("does_not_exist.csv");

    std::ostringstream out;
    std::ostringstream err;
    CHECK_THROWS_AS((void)runCommand(options, out, err), IoError);
}

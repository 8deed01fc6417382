/**
 * @file test_csv_writer.cpp
 * @brief Проверка экспорта в CSV и предпросмотра
 */

#include <doctest/doctest.h>
#include "io/csv_writer.hpp"
#include "io/csv_reader.hpp"
#include "io/file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace conic::io;
using namespace conic::model;

namespace {

SoundingTable makeResultTable() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    SoundingTable table;
    table.setColumn(Column::Depth, {0.5, 1.0, 1.5});
    table.setColumn(Column::Ic, {2.25, nan, 3.0});
    table.setConvergence({
        ConvergenceState::Converged,
        ConvergenceState::NotApplicable,
        ConvergenceState::NotConverged
    });
    return table;
}

} // namespace

TEST_CASE("value formatting") {
    const double inf = std::numeric_limits<double>::infinity();
    CHECK(formatValue(1.23456, 3, '.') == "1.235");
    CHECK(formatValue(1.5, 2, ',') == "1,50");
    CHECK(formatValue(std::numeric_limits<double>::quiet_NaN(), 3, '.').empty());
    CHECK(formatValue(inf, 3, '.') == "inf");
    CHECK(formatValue(-inf, 3, '.') == "-inf");
}

TEST_CASE("CSV text uses display names and creation order") {
    CsvExportOptions options;
    options.decimal_places = 2;
    const auto text = formatSoundingCsv(makeResultTable(), ColumnNames{}, options);

    std::istringstream in(text);
    std::string header, row1, row2, row3;
    std::getline(in, header);
    std::getline(in, row1);
    std::getline(in, row2);
    std::getline(in, row3);

    CHECK(header == "Depth (m),Ic (adim.),Convergence");
    CHECK(row1 == "0.50,2.25,converged");
    CHECK(row2 == "1.00,,");
    CHECK(row3 == "1.50,3.00,not_converged");
}

TEST_CASE("header cell with delimiter is quoted") {
    ColumnNames names;
    names.setName(Column::Depth, "Depth, m");
    SoundingTable table;
    table.setColumn(Column::Depth, {1.0});

    CsvExportOptions options;
    options.decimal_places = 1;
    CHECK(formatSoundingCsv(table, names, options) == "\"Depth, m\"\n1.0\n");
}

TEST_CASE("written file can be read back by the loader") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "conic_writer_roundtrip.csv";
    std::error_code ec;
    fs::remove(path, ec);

    SoundingTable table;
    table.setColumn(Column::Depth, {0.1, 0.2});
    table.setColumn(Column::Qc, {1.25, 1.5});
    table.setColumn(Column::Fs, {10.0, 11.0});
    table.setColumn(Column::U2, {20.0, 21.0});
    table.setColumn(Column::U0, {0.0, 0.0});

    writeSoundingCsv(table, ColumnNames{}, path);
    REQUIRE(fs::exists(path));
    CHECK_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    auto loaded = readSoundingCsv(path, {}, ColumnNames{}, HydrostaticSettings{});
    REQUIRE(loaded.rowCount() == 2);
    CHECK(loaded.value(Column::Qc, 1) == doctest::Approx(1.5));

    fs::remove(path, ec);
}

TEST_CASE("atomic write replaces an existing file") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "conic_atomic_overwrite.csv";
    std::error_code ec;
    fs::remove(path, ec);

    atomicWrite(path, "first,version\n");
    atomicWrite(path, "second\n");

    CHECK(readTextFile(path) == "second\n");
    CHECK_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    fs::remove(path, ec);
}

TEST_CASE("preview shows limited rows aligned to the widest cell") {
    const auto preview = formatPreview(makeResultTable(), ColumnNames{}, 2);

    CHECK(preview.find("Depth (m)") != std::string::npos);
    CHECK(preview.find("converged") != std::string::npos);
    CHECK(preview.find("not_converged") == std::string::npos);
    CHECK(preview.find("(3 строк)") != std::string::npos);
}

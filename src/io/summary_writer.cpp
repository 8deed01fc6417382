/**
 * @file summary_writer.cpp
 * @brief Запись сводки обработки
 */

#include "summary_writer.hpp"
#include "config_io.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace conic::io {
namespace {

using namespace conic::model;

nlohmann::json columnStatistics(const SoundingTable& table) {
    nlohmann::json stats = nlohmann::json::object();

    for (Column column : table.numericColumns()) {
        size_t finite = 0;
        double min_value = 0.0;
        double max_value = 0.0;
        for (double v : table.values(column)) {
            if (!std::isfinite(v)) continue;
            if (finite == 0) {
                min_value = v;
                max_value = v;
            } else {
                min_value = std::min(min_value, v);
                max_value = std::max(max_value, v);
            }
            ++finite;
        }

        nlohmann::json c;
        c["finite"] = finite;
        c["missing"] = table.rowCount() - finite;
        c["min"] = finite > 0 ? nlohmann::json(min_value) : nlohmann::json(nullptr);
        c["max"] = finite > 0 ? nlohmann::json(max_value) : nlohmann::json(nullptr);
        stats[std::string(columnKey(column))] = c;
    }
    return stats;
}

nlohmann::json buildJson(
    const core::PipelineResult& result,
    const ConicConfig& config,
    const RunMeta& meta
) {
    nlohmann::json j;
    const auto& summary = result.summary;

    j["meta"] = {
        {"app_version", meta.app_version},
        {"input", meta.input_path},
        {"timestamp", meta.timestamp.empty() ? currentTimestamp() : meta.timestamp}
    };
    j["config"] = nlohmann::json::parse(configToJson(config));

    j["rows"] = {
        {"read", summary.rows_read},
        {"removed", summary.rows_removed},
        {"replaced", summary.rows_replaced},
        {"output", summary.rows_out}
    };
    j["convergence"] = {
        {"converged", summary.converged},
        {"not_converged", summary.not_converged},
        {"not_applicable", summary.not_applicable}
    };
    j["depth_spacing"] = summary.depth_spacing.has_value()
        ? nlohmann::json(*summary.depth_spacing)
        : nlohmann::json(nullptr);

    j["columns"] = columnStatistics(result.table);
    j["warnings"] = result.warnings;
    return j;
}

} // namespace

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const std::tm tm = *std::localtime(&time);

    std::ostringstream ss;
    ss << (1900 + tm.tm_year) << "-"
       << std::setfill('0') << std::setw(2) << (tm.tm_mon + 1) << "-"
       << std::setw(2) << tm.tm_mday << "T"
       << std::setw(2) << tm.tm_hour << ":"
       << std::setw(2) << tm.tm_min << ":"
       << std::setw(2) << tm.tm_sec;
    return ss.str();
}

std::string formatRunSummary(
    const core::PipelineResult& result,
    const model::ConicConfig& config,
    const RunMeta& meta,
    int indent
) {
    return buildJson(result, config, meta).dump(indent);
}

void writeRunSummary(
    const core::PipelineResult& result,
    const model::ConicConfig& config,
    const RunMeta& meta,
    const std::filesystem::path& path
) {
    atomicWrite(path, formatRunSummary(result, config, meta) + "\n");
}

} // namespace conic::io

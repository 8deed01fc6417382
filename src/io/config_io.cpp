/**
 * @file config_io.cpp
 * @brief Реализация чтения и записи конфигурации
 */

#include "config_io.hpp"
#include "file_utils.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>

namespace conic::io {

using json = nlohmann::json;

namespace {

// === Сериализация базовых типов ===

json optionalToJson(const std::optional<double>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

std::optional<double> optionalFromJson(const json& j) {
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<double>();
}

/// NaN в JSON не представим, записывается как null
json scalarToJson(double value) {
    if (std::isnan(value)) {
        return nullptr;
    }
    return value;
}

double scalarFromJson(const json& j) {
    if (j.is_null()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return j.get<double>();
}

std::string delimiterToString(char delimiter) {
    if (delimiter == '\t') {
        return "\\t";
    }
    return std::string(1, delimiter);
}

// === Секции ===

void readColumnNames(const json& j, ColumnNames& names, bool input) {
    if (!j.is_object()) {
        throw ConfigError(std::string("Секция columns.") + (input ? "input" : "output") +
                          " должна быть объектом");
    }
    for (const auto& [key, value] : j.items()) {
        const auto column = parseColumnKey(key);
        if (!column.has_value()) {
            throw ConfigError("Неизвестная колонка в конфигурации: '" + key + "'");
        }
        const bool is_input = std::find(kInputColumns.begin(), kInputColumns.end(), *column)
                              != kInputColumns.end();
        if (input != is_input) {
            throw ConfigError("Колонка '" + key + "' должна быть в секции columns." +
                              (is_input ? "input" : "output"));
        }
        names.setName(*column, value.get<std::string>());
    }
}

json columnNamesToJson(const ColumnNames& names, bool input) {
    json j = json::object();
    for (Column column : kAllColumns) {
        const bool is_input = std::find(kInputColumns.begin(), kInputColumns.end(), column)
                              != kInputColumns.end();
        if (is_input == input) {
            j[std::string(columnKey(column))] = names.name(column);
        }
    }
    return j;
}

ConicConfig configFromJsonInternal(const json& j) {
    ConicConfig config;
    if (!j.is_object()) {
        throw ConfigError("Конфигурация должна быть JSON объектом");
    }

    if (j.contains("columns")) {
        const auto& columns = j.at("columns");
        if (columns.contains("input")) {
            readColumnNames(columns.at("input"), config.columns, true);
        }
        if (columns.contains("output")) {
            readColumnNames(columns.at("output"), config.columns, false);
        }
    }

    if (j.contains("cone")) {
        const auto& cone = j.at("cone");
        config.stress.area_ratio = cone.value("area_ratio", config.stress.area_ratio);
    }

    if (j.contains("soil")) {
        const auto& soil = j.at("soil");
        config.stress.gamma_soil = UnitWeight{soil.value("gamma_soil", config.stress.gamma_soil.value)};
        config.hydrostatic.gamma_w = UnitWeight{soil.value("gamma_w", config.hydrostatic.gamma_w.value)};
        config.hydrostatic.water_level = Meters{soil.value("water_level", config.hydrostatic.water_level.value)};
    }

    if (j.contains("smoothing")) {
        const auto& smoothing = j.at("smoothing");
        config.stress.rolling_window = smoothing.value("rolling_window", config.stress.rolling_window);
    }

    if (j.contains("solver")) {
        const auto& solver = j.at("solver");
        config.solver.p_ref = Kilopascals{solver.value("p_ref", config.solver.p_ref.value)};
        config.solver.max_iter = solver.value("max_iter", config.solver.max_iter);
        config.solver.tolerance = solver.value("tolerance", config.solver.tolerance);
        config.solver.secondary_indices = solver.value("secondary_indices", config.solver.secondary_indices);
    }

    if (j.contains("cleaning")) {
        const auto& cleaning = j.at("cleaning");
        if (cleaning.contains("mode")) {
            const auto mode_str = cleaning.at("mode").get<std::string>();
            const auto mode = parseCleaningMode(mode_str);
            if (!mode.has_value()) {
                throw ConfigError("Неизвестный режим очистки: '" + mode_str +
                                  "' (допустимо: remove, replace, none)");
            }
            config.cleaning.mode = *mode;
        }
        if (cleaning.contains("indicators")) {
            config.cleaning.indicators = cleaning.at("indicators").get<std::vector<double>>();
        }
        if (cleaning.contains("replacement")) {
            config.cleaning.replacement = scalarFromJson(cleaning.at("replacement"));
        }
    }

    if (j.contains("depth_adjustment")) {
        const auto& depth = j.at("depth_adjustment");
        config.depth_adjustment.enabled = depth.value("enabled", config.depth_adjustment.enabled);
        if (depth.contains("start")) {
            config.depth_adjustment.start = optionalFromJson(depth.at("start"));
        }
        if (depth.contains("spacing")) {
            config.depth_adjustment.spacing = optionalFromJson(depth.at("spacing"));
        }
    }

    if (j.contains("csv")) {
        const auto& csv = j.at("csv");
        if (csv.contains("delimiter") && !csv.at("delimiter").is_null()) {
            config.csv.delimiter = parseDelimiter(csv.at("delimiter").get<std::string>());
        }
    }

    return config;
}

json configToJsonInternal(const ConicConfig& config) {
    json j;
    j["columns"] = {
        {"input", columnNamesToJson(config.columns, true)},
        {"output", columnNamesToJson(config.columns, false)}
    };
    j["cone"] = {{"area_ratio", config.stress.area_ratio}};
    j["soil"] = {
        {"gamma_soil", config.stress.gamma_soil.value},
        {"gamma_w", config.hydrostatic.gamma_w.value},
        {"water_level", config.hydrostatic.water_level.value}
    };
    j["smoothing"] = {{"rolling_window", config.stress.rolling_window}};
    j["solver"] = {
        {"p_ref", config.solver.p_ref.value},
        {"max_iter", config.solver.max_iter},
        {"tolerance", config.solver.tolerance},
        {"secondary_indices", config.solver.secondary_indices}
    };
    j["cleaning"] = {
        {"mode", toString(config.cleaning.mode)},
        {"indicators", config.cleaning.indicators},
        {"replacement", scalarToJson(config.cleaning.replacement)}
    };
    j["depth_adjustment"] = {
        {"enabled", config.depth_adjustment.enabled},
        {"start", optionalToJson(config.depth_adjustment.start)},
        {"spacing", optionalToJson(config.depth_adjustment.spacing)}
    };
    j["csv"] = {
        {"delimiter", config.csv.delimiter.has_value()
            ? json(delimiterToString(*config.csv.delimiter))
            : json(nullptr)}
    };
    return j;
}

} // namespace

char parseDelimiter(std::string_view text) {
    if (text == "\\t" || text == "tab") {
        return '\t';
    }
    if (text.size() != 1) {
        throw ConfigError("Разделитель должен быть одним символом, получено \"" +
                          std::string(text) + "\"");
    }
    return text.front();
}

ConicConfig configFromJson(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    try {
        return configFromJsonInternal(j);
    } catch (const json::exception& e) {
        throw ConfigError("Некорректное значение в конфигурации: " + std::string(e.what()));
    }
}

std::string configToJson(const ConicConfig& config, int indent) {
    return configToJsonInternal(config).dump(indent);
}

ConicConfig loadConfig(const std::filesystem::path& path) {
    const auto text = readTextFile(path);
    ConicConfig config = configFromJson(text);

    const auto validation = validateConfig(config);
    if (!validation.is_valid) {
        throw ConfigError("Некорректная конфигурация " + path.string() + ": " +
                          validation.errorSummary());
    }
    return config;
}

void saveConfig(const ConicConfig& config, const std::filesystem::path& path) {
    atomicWrite(path, configToJson(config) + "\n");
}

} // namespace conic::io

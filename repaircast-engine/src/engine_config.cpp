#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace repaircast {

namespace {

// Read a non-negative integer count
size_t read_count(const json& section, const char* key, size_t fallback, const std::string& path) {
    if (!section.contains(key)) {
        return fallback;
    }
    const json& value = section[key];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigParseError(path + "." + key + " must be a non-negative integer");
    }
    return static_cast<size_t>(value.get<long long>());
}

double read_number(const json& section, const char* key, double fallback, const std::string& path) {
    if (!section.contains(key)) {
        return fallback;
    }
    const json& value = section[key];
    if (!value.is_number()) {
        throw ConfigParseError(path + "." + key + " must be a number");
    }
    return value.get<double>();
}

} // anonymous namespace

void validate_engine_config(const EngineConfig& config) {
    if (config.fallback.target_items < 1) {
        throw ConfigParseError("fallback.target_items must be at least 1");
    }
    if (config.fallback.min_detections > 0 && config.fallback.templates.empty()) {
        throw ConfigParseError("fallback.templates must not be empty when padding is enabled");
    }
    if (config.top_systems < 1) {
        throw ConfigParseError("portfolio.top_systems must be at least 1");
    }
    if (config.schedule.inflation_rate < 0.0) {
        throw ConfigParseError("schedule.inflation_rate must be non-negative");
    }
    if (config.schedule.contingency_buffer < 0.0) {
        throw ConfigParseError("schedule.contingency_buffer must be non-negative");
    }
    if (config.schedule.years < 1 || config.schedule.years > MAX_YEAR) {
        throw ConfigParseError("schedule.years must be between 1 and " + std::to_string(MAX_YEAR));
    }
    const std::string& level = config.logging.level;
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        throw ConfigParseError("logging.level must be one of DEBUG, INFO, WARN, ERROR");
    }
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::exception& e) {
        throw ConfigParseError("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw ConfigParseError("Engine config must be a JSON object");
    }

    try {
        if (j.contains("fallback")) {
            const json& fallback = j["fallback"];
            config.fallback.min_detections =
                read_count(fallback, "min_detections", config.fallback.min_detections, "fallback");
            config.fallback.target_items =
                read_count(fallback, "target_items", config.fallback.target_items, "fallback");
            if (fallback.contains("templates")) {
                config.fallback.templates.clear();
                for (const auto& label : fallback["templates"]) {
                    config.fallback.templates.push_back(label.get<std::string>());
                }
            }
        }

        if (j.contains("portfolio")) {
            config.top_systems = read_count(j["portfolio"], "top_systems", config.top_systems, "portfolio");
        }

        if (j.contains("schedule")) {
            const json& schedule = j["schedule"];
            config.schedule.inflation_rate =
                read_number(schedule, "inflation_rate", config.schedule.inflation_rate, "schedule");
            config.schedule.contingency_buffer =
                read_number(schedule, "contingency_buffer", config.schedule.contingency_buffer, "schedule");
            const size_t years =
                read_count(schedule, "years", static_cast<size_t>(config.schedule.years), "schedule");
            if (years > static_cast<size_t>(MAX_YEAR)) {
                throw ConfigParseError("schedule.years must be between 1 and " + std::to_string(MAX_YEAR));
            }
            config.schedule.years = static_cast<int>(years);
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            if (logging.contains("level")) config.logging.level = logging["level"].get<std::string>();
            if (logging.contains("json")) config.logging.json = logging["json"].get<bool>();
            if (logging.contains("file")) config.logging.file = logging["file"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid engine config value: " + std::string(e.what()));
    }

    validate_engine_config(config);
    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open engine config: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_engine_config_from_string(buffer.str());
}

} // namespace repaircast

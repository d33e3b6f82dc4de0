#ifndef REPAIRCAST_ENGINE_CONFIG_HPP
#define REPAIRCAST_ENGINE_CONFIG_HPP

#include "portfolio.hpp"
#include "schedule.hpp"
#include "synthetic_series.hpp"
#include <stdexcept>
#include <string>

namespace repaircast {

/**
 * @brief Exception thrown when an engine config cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

struct LoggingSettings {
    std::string level;          ///< DEBUG, INFO, WARN or ERROR
    bool json;                  ///< JSON lines vs. plain text
    std::string file;           ///< Optional log file (empty = console only)

    LoggingSettings() : level("INFO"), json(true) {}
};

/**
 * @brief Tunables for one engine run
 *
 * Every default reproduces the reference behavior: pad photos with fewer
 * than 2 usable detections up to 3 items, rank the top 3 systems, and
 * project repair schedules over 10 years at 4.5% inflation with a 20%
 * contingency buffer.
 */
struct EngineConfig {
    FallbackItemParams fallback;
    size_t top_systems;
    ScheduleProjectionParams schedule;
    LoggingSettings logging;

    EngineConfig() : top_systems(DEFAULT_TOP_SYSTEMS) {}
};

/**
 * @brief Parses an engine config from a JSON string
 *
 * Recognized sections: fallback, portfolio, schedule, logging. Unknown keys
 * are ignored; missing keys keep their defaults.
 *
 * @throws ConfigParseError if JSON is invalid or a value fails validation
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Parses an engine config from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or parsed
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Checks value ranges
 *
 * @throws ConfigParseError describing the first violation
 */
void validate_engine_config(const EngineConfig& config);

} // namespace repaircast

#endif // REPAIRCAST_ENGINE_CONFIG_HPP

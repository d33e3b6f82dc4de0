/**
 * @file logger.hpp
 * @brief Run-level event log for the engine CLI
 *
 * Each event is one line on stderr (and optionally a file), either a JSON
 * object or "timestamp [LEVEL] message {key=value, ...}". Every field value
 * is written as a string. The projection and aggregation code does not log;
 * the session builder and the CLI report what happened around it.
 */

#ifndef REPAIRCAST_LOGGER_HPP
#define REPAIRCAST_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace repaircast {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Upper-case level name as written in log lines
std::string level_to_string(LogLevel level);

// Inverse of level_to_string; anything unrecognised is INFO
LogLevel string_to_level(const std::string& name);

// Event payload, sorted by key so lines are stable across runs
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Photo and phase an event belongs to
 *
 * Both members are optional; empty values are left out of the line.
 */
struct LogContext {
    std::string photo_id;
    std::string phase;               ///< load, process, report or run

    LogContext() = default;

    LogContext(const std::string& id, const std::string& run_phase)
        : photo_id(id), phase(run_phase) {}
};

struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;             ///< stderr
    bool enable_file;
    std::string log_file_path;       ///< Opened in append mode
    bool enable_json;                ///< false selects the plain text layout

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("repaircast.log"),
          enable_json(true) {}
};

/**
 * @brief Process-wide logger
 *
 * The CLI configures it once from the "logging" section of the engine
 * config. Tests reconfigure it to write to a scratch file.
 */
class Logger {
public:
    static Logger& get_instance();

    // Replaces the current settings and reopens the log file if one is set
    void configure(const LoggerConfig& config);

    // Every setting is logged as "config.<key>"
    void log_run_start(const LogFields& settings);

    void log_photo_processed(
        const LogContext& ctx,
        size_t profile_count,
        size_t matched_count,
        size_t synthetic_count
    );

    // Placeholder items were appended to reach the target item count
    void log_fallback_items(
        const LogContext& ctx,
        size_t usable_detections,
        size_t added
    );

    /**
     * @brief A malformed input field was replaced by its default
     *
     * @param field JSON path of the field, e.g. "detections[2].severity"
     * @param detail Replacement that was applied
     */
    void log_input_warning(
        const LogContext& ctx,
        const std::string& field,
        const std::string& detail
    );

    void log_report_complete(
        size_t photo_count,
        size_t profile_count,
        double total_15_year,
        double elapsed_ms
    );

    void log_error(const LogContext& ctx, const std::string& error_message);

    void log_warning(const LogContext& ctx, const std::string& warning_message);

    void log_debug(
        const LogContext& ctx,
        const std::string& message,
        const LogFields& fields = {}
    );

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    bool enabled(LogLevel level) const { return level >= config_.min_level; }

    void emit(LogLevel level, const std::string& message, const LogContext& ctx, LogFields fields);
    std::string render_json(LogLevel level, const std::string& message, const LogFields& fields) const;
    std::string render_text(LogLevel level, const std::string& message, const LogFields& fields) const;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
};

} // namespace repaircast

#endif // REPAIRCAST_LOGGER_HPP

/**
 * @file logger.cpp
 * @brief Logger event formatting and sinks
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace repaircast {

namespace {

const std::array<std::pair<LogLevel, const char*>, 4> LEVEL_NAMES = {{
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARN, "WARN"},
    {LogLevel::ERROR, "ERROR"},
}};

// UTC, ISO 8601 with milliseconds
std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

std::string count(size_t value) {
    return std::to_string(value);
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.first == level) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& name) {
    for (const auto& entry : LEVEL_NAMES) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return LogLevel::INFO;
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: cannot open log file " << config_.log_file_path
                  << ", logging to stderr only" << std::endl;
        file_stream_.reset();
    }
}

void Logger::log_run_start(const LogFields& settings) {
    LogFields fields{{"event", "run_start"}};
    for (const auto& [key, value] : settings) {
        fields.emplace("config." + key, value);
    }
    emit(LogLevel::INFO, "Engine run started", LogContext(), std::move(fields));
}

void Logger::log_photo_processed(
    const LogContext& ctx,
    size_t profile_count,
    size_t matched_count,
    size_t synthetic_count
) {
    emit(LogLevel::INFO, "Photo processed", ctx, {
        {"event", "photo_processed"},
        {"profile_count", count(profile_count)},
        {"matched_count", count(matched_count)},
        {"synthetic_count", count(synthetic_count)},
    });
}

void Logger::log_fallback_items(const LogContext& ctx, size_t usable_detections, size_t added) {
    emit(LogLevel::INFO, "Padded sparse detections with placeholder items", ctx, {
        {"event", "fallback_items"},
        {"usable_detections", count(usable_detections)},
        {"added", count(added)},
    });
}

void Logger::log_input_warning(
    const LogContext& ctx,
    const std::string& field,
    const std::string& detail
) {
    emit(LogLevel::WARN, "Malformed input field defaulted", ctx, {
        {"event", "input_warning"},
        {"field", field},
        {"detail", detail},
    });
}

void Logger::log_report_complete(
    size_t photo_count,
    size_t profile_count,
    double total_15_year,
    double elapsed_ms
) {
    std::ostringstream total;
    total << std::fixed << std::setprecision(2) << total_15_year;
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(3) << elapsed_ms;

    emit(LogLevel::INFO, "Portfolio report complete", LogContext(), {
        {"event", "report_complete"},
        {"photo_count", count(photo_count)},
        {"profile_count", count(profile_count)},
        {"total_15_year", total.str()},
        {"elapsed_ms", elapsed.str()},
    });
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    emit(LogLevel::ERROR, "Engine error", ctx, {
        {"event", "error"},
        {"error_message", error_message},
    });
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    emit(LogLevel::WARN, warning_message, ctx, {{"event", "warning"}});
}

void Logger::log_debug(const LogContext& ctx, const std::string& message, const LogFields& fields) {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }
    LogFields payload = fields;
    payload["event"] = "debug";
    emit(LogLevel::DEBUG, message, ctx, std::move(payload));
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::emit(LogLevel level, const std::string& message, const LogContext& ctx, LogFields fields) {
    if (!enabled(level)) {
        return;
    }

    if (!ctx.photo_id.empty()) fields["photo_id"] = ctx.photo_id;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;

    const std::string line = config_.enable_json
        ? render_json(level, message, fields)
        : render_text(level, message, fields);

    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (config_.enable_file && file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string Logger::render_json(LogLevel level, const std::string& message, const LogFields& fields) const {
    nlohmann::json entry(fields);
    entry["timestamp"] = utc_timestamp();
    entry["level"] = level_to_string(level);
    entry["message"] = message;
    // Invalid UTF-8 in labels is replaced rather than thrown on
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::render_text(LogLevel level, const std::string& message, const LogFields& fields) const {
    std::ostringstream line;
    line << utc_timestamp() << " [" << level_to_string(level) << "] " << message;

    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        line << separator << key << '=' << value;
        separator = ", ";
    }
    if (!fields.empty()) {
        line << '}';
    }
    return line.str();
}

} // namespace repaircast

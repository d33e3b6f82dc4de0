/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace repaircast;
using json = nlohmann::json;

namespace {

const char* const TEST_LOG_FILE = "repaircast_test_logger.log";

// Route the logger to a fresh file only
void configure_file_logger(LogLevel level, bool json_output = true) {
    std::filesystem::remove(TEST_LOG_FILE);

    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = TEST_LOG_FILE;
    config.enable_json = json_output;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_log_lines() {
    Logger::get_instance().flush();
    std::vector<std::string> lines;
    std::ifstream file(TEST_LOG_FILE);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void restore_default_logger() {
    Logger::get_instance().configure(LoggerConfig());
    std::filesystem::remove(TEST_LOG_FILE);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level conversion") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Log level filtering") {
        configure_file_logger(LogLevel::WARN);
        REQUIRE(Logger::get_instance().get_min_level() == LogLevel::WARN);

        Logger& logger = Logger::get_instance();
        logger.log_debug(LogContext("IMG_1", "process"), "hidden");
        logger.log_photo_processed(LogContext("IMG_1", "process"), 3, 1, 0);
        logger.log_input_warning(LogContext("IMG_1", "load"), "detections[0].severity", "defaulted");

        std::vector<std::string> lines = read_log_lines();
        REQUIRE(lines.size() == 1);
        REQUIRE(json::parse(lines[0])["event"] == "input_warning");

        restore_default_logger();
    }
}

TEST_CASE("Logger JSON events", "[logger]") {
    configure_file_logger(LogLevel::DEBUG);
    Logger& logger = Logger::get_instance();

    SECTION("photo_processed") {
        logger.log_photo_processed(LogContext("IMG_0042", "process"), 3, 1, 2);

        std::vector<std::string> lines = read_log_lines();
        REQUIRE(lines.size() == 1);
        json entry = json::parse(lines[0]);
        REQUIRE(entry["event"] == "photo_processed");
        REQUIRE(entry["level"] == "INFO");
        REQUIRE(entry["photo_id"] == "IMG_0042");
        REQUIRE(entry["phase"] == "process");
        REQUIRE(entry["profile_count"] == "3");
        REQUIRE(entry["matched_count"] == "1");
        REQUIRE(entry["synthetic_count"] == "2");
        REQUIRE(entry.contains("timestamp"));
        REQUIRE(entry.contains("message"));
    }

    SECTION("run_start prefixes settings") {
        logger.log_run_start({{"input", "session.json"}, {"top_systems", "3"}});

        json entry = json::parse(read_log_lines().at(0));
        REQUIRE(entry["event"] == "run_start");
        REQUIRE(entry["config.input"] == "session.json");
        REQUIRE(entry["config.top_systems"] == "3");
    }

    SECTION("error message is escaped") {
        logger.log_error(LogContext("", "run"), "Bad \"quote\"\nnext line");

        json entry = json::parse(read_log_lines().at(0));
        REQUIRE(entry["event"] == "error");
        REQUIRE(entry["level"] == "ERROR");
        REQUIRE(entry["error_message"] == "Bad \"quote\"\nnext line");
        REQUIRE_FALSE(entry.contains("photo_id"));
    }

    SECTION("report_complete and fallback_items") {
        logger.log_fallback_items(LogContext("IMG_2", "process"), 0, 3);
        logger.log_report_complete(2, 5, 12345.0, 1.5);

        std::vector<std::string> lines = read_log_lines();
        REQUIRE(lines.size() == 2);
        REQUIRE(json::parse(lines[0])["added"] == "3");
        json done = json::parse(lines[1]);
        REQUIRE(done["event"] == "report_complete");
        REQUIRE(done["photo_count"] == "2");
        REQUIRE(done["profile_count"] == "5");
    }

    SECTION("debug carries extra fields") {
        logger.log_debug(LogContext("IMG_3", "process"), "Profile built", {{"label", "Boiler"}});

        json entry = json::parse(read_log_lines().at(0));
        REQUIRE(entry["level"] == "DEBUG");
        REQUIRE(entry["label"] == "Boiler");
    }

    restore_default_logger();
}

TEST_CASE("Logger plain text output", "[logger]") {
    configure_file_logger(LogLevel::INFO, false);

    Logger::get_instance().log_warning(LogContext("IMG_9", "report"), "No profile labeled 'Roof'");

    std::vector<std::string> lines = read_log_lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] No profile labeled 'Roof'") != std::string::npos);
    REQUIRE(lines[0].find("photo_id=IMG_9") != std::string::npos);

    restore_default_logger();
}

#include <catch2/catch_test_macros.hpp>
#include "engine_config.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace repaircast;

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig config;

    REQUIRE(config.fallback.min_detections == 2);
    REQUIRE(config.fallback.target_items == 3);
    REQUIRE(config.fallback.templates.size() == 3);
    REQUIRE(config.top_systems == 3);
    REQUIRE(config.schedule.inflation_rate == 0.045);
    REQUIRE(config.schedule.contingency_buffer == 0.20);
    REQUIRE(config.schedule.years == 10);
    REQUIRE(config.logging.level == "INFO");
    REQUIRE(config.logging.json);
    REQUIRE(config.logging.file.empty());

    REQUIRE_NOTHROW(validate_engine_config(config));
}

TEST_CASE("Empty config object keeps defaults", "[config]") {
    EngineConfig config = parse_engine_config_from_string("{}");
    REQUIRE(config.top_systems == 3);
    REQUIRE(config.fallback.target_items == 3);
}

TEST_CASE("Config sections override defaults", "[config]") {
    EngineConfig config = parse_engine_config_from_string(R"({
        "fallback": { "min_detections": 1, "target_items": 4, "templates": ["Roof", "Walls"] },
        "portfolio": { "top_systems": 5 },
        "schedule": { "inflation_rate": 0.03, "contingency_buffer": 0.1, "years": 15 },
        "logging": { "level": "DEBUG", "json": false, "file": "run.log" },
        "unknown": { "ignored": true }
    })");

    REQUIRE(config.fallback.min_detections == 1);
    REQUIRE(config.fallback.target_items == 4);
    REQUIRE(config.fallback.templates.size() == 2);
    REQUIRE(config.fallback.templates[0] == "Roof");
    REQUIRE(config.fallback.templates[1] == "Walls");
    REQUIRE(config.top_systems == 5);
    REQUIRE(config.schedule.inflation_rate == 0.03);
    REQUIRE(config.schedule.contingency_buffer == 0.1);
    REQUIRE(config.schedule.years == 15);
    REQUIRE(config.logging.level == "DEBUG");
    REQUIRE_FALSE(config.logging.json);
    REQUIRE(config.logging.file == "run.log");
}

TEST_CASE("Partial sections keep the remaining defaults", "[config]") {
    EngineConfig config = parse_engine_config_from_string(R"({"schedule": {"years": 5}})");
    REQUIRE(config.schedule.years == 5);
    REQUIRE(config.schedule.inflation_rate == 0.045);
}

TEST_CASE("Invalid configs are rejected", "[config]") {
    REQUIRE_THROWS_AS(parse_engine_config_from_string("{ not json"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string("[1, 2]"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"portfolio": {"top_systems": 0}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"portfolio": {"top_systems": -2}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"fallback": {"target_items": 0}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"fallback": {"templates": []}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"inflation_rate": -0.01}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"contingency_buffer": -1}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"years": 16}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"inflation_rate": "high"}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"logging": {"level": "TRACE"}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"logging": {"json": "yes"}})"), ConfigParseError);
}

TEST_CASE("Oversized schedule years are rejected before narrowing", "[config]") {
    // 2^32 + 10 would truncate to 10 as a 32-bit int
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"years": 4294967306}})"), ConfigParseError);
    REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"schedule": {"years": 9223372036854775807}})"),
                      ConfigParseError);
}

TEST_CASE("Empty templates are allowed when padding is disabled", "[config]") {
    EngineConfig config = parse_engine_config_from_string(
        R"({"fallback": {"min_detections": 0, "templates": []}})");
    REQUIRE(config.fallback.templates.empty());
}

TEST_CASE("ConfigParseError is a runtime_error", "[config]") {
    try {
        parse_engine_config_from_string("{");
        FAIL("Expected ConfigParseError");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("Failed to parse JSON") != std::string::npos);
    }
}

TEST_CASE("Config is read from a file", "[config]") {
    const std::string path = "repaircast_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"portfolio": {"top_systems": 2}})";
    }

    EngineConfig config = parse_engine_config_from_file(path);
    REQUIRE(config.top_systems == 2);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(parse_engine_config_from_file("does_not_exist.json"), ConfigParseError);
}

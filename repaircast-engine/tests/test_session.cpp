#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "session.hpp"
#include "logger.hpp"

using namespace repaircast;
using Catch::Matchers::WithinAbs;

namespace {

struct QuietLogger {
    QuietLogger() {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
    ~QuietLogger() {
        Logger::get_instance().configure(LoggerConfig());
    }
};

std::vector<PhotoInput> make_inputs() {
    PhotoInput a;
    a.id = "IMG_A";
    a.file_name = "a.jpg";
    a.detections = {DamageItem("Boiler", 3), DamageItem("Roof leak", 4)};

    AuthoritativeAnalysis boiler;
    boiler.damage_item = "BOILER";
    boiler.category = "Heating system";
    boiler.yearly_costs = {YearlyCostRow(8, 3200.0, "Replace heat exchanger")};
    a.analyses = {boiler};

    PhotoInput b;
    b.id = "IMG_B";
    b.file_name = "b.jpg";
    b.detections = {DamageItem("Boiler", 2)};

    PhotoInput c;
    c.id = "IMG_C";
    c.file_name = "c.jpg";

    return {a, b, c};
}

} // anonymous namespace

TEST_CASE("process_photo builds profiles for one photo", "[session]") {
    QuietLogger quiet;
    EngineConfig config;

    ProcessedPhoto photo = process_photo(make_inputs()[0], config);

    REQUIRE(photo.id == "IMG_A");
    REQUIRE(photo.file_name == "a.jpg");
    REQUIRE(photo.cost_profiles.size() == 2);
    REQUIRE(photo.cost_profiles[0].authoritative);
    REQUIRE(photo.cost_profiles[0].category == "Heating system");
    REQUIRE(photo.cost_profiles[0].cost_in_year(8) == 3200.0);
    REQUIRE_FALSE(photo.cost_profiles[1].authoritative);
}

TEST_CASE("process_session pads sparse photos using the config", "[session]") {
    QuietLogger quiet;
    EngineConfig config;

    std::vector<ProcessedPhoto> photos = process_session(make_inputs(), config);
    REQUIRE(photos.size() == 3);
    REQUIRE(photos[1].cost_profiles.size() == 3);
    REQUIRE(photos[2].cost_profiles.size() == 3);

    config.fallback.min_detections = 0;
    photos = process_session(make_inputs(), config);
    REQUIRE(photos[1].cost_profiles.size() == 1);
    REQUIRE(photos[2].cost_profiles.empty());
}

TEST_CASE("Session report holds the portfolio and requested drill-downs", "[session]") {
    QuietLogger quiet;
    EngineConfig config;

    SessionReport report = build_session_report(make_inputs(), config, 10, std::string("Boiler"));

    REQUIRE(report.photos.size() == 3);
    REQUIRE(report.portfolio.has_value());
    REQUIRE(report.portfolio->photo_count == 3);
    REQUIRE(report.portfolio->profile_count == 8);
    REQUIRE(report.portfolio->top_systems.size() == 3);

    REQUIRE(report.horizon_drill_down.has_value());
    REQUIRE(report.horizon_drill_down->horizon_year == 10);

    REQUIRE(report.system_drill_down.has_value());
    REQUIRE(report.system_drill_down->instances.size() == 2);

    double boiler_total = report.photos[0].cost_profiles[0].horizon_total(15) +
                          report.photos[1].cost_profiles[0].horizon_total(15);
    REQUIRE_THAT(report.system_drill_down->total_cost, WithinAbs(boiler_total, 1e-9));
}

TEST_CASE("Session report without drill-down requests", "[session]") {
    QuietLogger quiet;
    SessionReport report = build_session_report(make_inputs(), EngineConfig());

    REQUIRE(report.portfolio.has_value());
    REQUIRE_FALSE(report.horizon_drill_down.has_value());
    REQUIRE_FALSE(report.system_drill_down.has_value());
}

TEST_CASE("Session report for an unknown system or empty session", "[session]") {
    QuietLogger quiet;

    SessionReport unknown = build_session_report(make_inputs(), EngineConfig(), std::nullopt, std::string("Window"));
    REQUIRE_FALSE(unknown.system_drill_down.has_value());

    SessionReport empty = build_session_report({}, EngineConfig(), 5);
    REQUIRE(empty.photos.empty());
    REQUIRE_FALSE(empty.portfolio.has_value());
    REQUIRE_FALSE(empty.horizon_drill_down.has_value());
}

TEST_CASE("Session report respects the top systems limit", "[session]") {
    QuietLogger quiet;
    EngineConfig config;
    config.top_systems = 1;

    SessionReport report = build_session_report(make_inputs(), config);
    REQUIRE(report.portfolio->top_systems.size() == 1);
}

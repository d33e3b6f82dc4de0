#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "io/session_reader.hpp"
#include "logger.hpp"

using namespace repaircast;
using Catch::Matchers::WithinAbs;

namespace {

// Keep malformed-input warnings out of the test output
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

} // anonymous namespace

TEST_CASE("Reader accepts a photos object", "[reader]") {
    auto inputs = io::read_session_from_string(R"({
        "photos": [
            { "id": "IMG_1", "file_name": "a.jpg",
              "detections": [ { "label": "Roof leak", "severity": 4 } ] },
            { "id": "IMG_2", "file_name": "b.jpg" }
        ]
    })");

    REQUIRE(inputs.size() == 2);
    REQUIRE(inputs[0].id == "IMG_1");
    REQUIRE(inputs[0].file_name == "a.jpg");
    REQUIRE(inputs[0].detections.size() == 1);
    REQUIRE(inputs[0].detections[0] == DamageItem("Roof leak", 4));
    REQUIRE(inputs[1].detections.empty());
    REQUIRE(inputs[1].analyses.empty());
}

TEST_CASE("Reader accepts a bare array and a single photo", "[reader]") {
    auto from_array = io::read_session_from_string(R"([ { "id": "A" }, { "id": "B" } ])");
    REQUIRE(from_array.size() == 2);

    auto single = io::read_session_from_string(R"({ "imageID": "IMG_7", "fileName": "x.jpg", "annotation": [] })");
    REQUIRE(single.size() == 1);
    REQUIRE(single[0].id == "IMG_7");
    REQUIRE(single[0].file_name == "x.jpg");
}

TEST_CASE("Reader fills missing ids and file names", "[reader]") {
    auto inputs = io::read_session_from_string(R"([ { "file_name": "roof.jpg" }, {}, { "id": "only-id" } ])");

    REQUIRE(inputs[0].id == "roof.jpg");
    REQUIRE(inputs[1].id == "photo-2");
    REQUIRE(inputs[1].file_name == "photo-2");
    REQUIRE(inputs[2].file_name == "only-id");
}

TEST_CASE("Reader consolidates severities", "[reader]") {
    QuietLogger quiet;
    auto inputs = io::read_session_from_string(R"({ "detections": [
        { "label": "a", "severity": 9 },
        { "label": "b", "severity": 2.7 },
        { "label": "c", "severity": "4" },
        { "label": "d", "severity": "severe" },
        { "label": "e" },
        { "label": "f", "severity": [1] }
    ] })");

    const auto& d = inputs.at(0).detections;
    REQUIRE(d.size() == 6);
    REQUIRE(d[0].severity == 5);
    REQUIRE(d[1].severity == 2);
    REQUIRE(d[2].severity == 4);
    REQUIRE(d[3].severity == 3);
    REQUIRE(d[4].severity == 3);
    REQUIRE(d[5].severity == 3);
}

TEST_CASE("Reader keeps detections with blank labels", "[reader]") {
    QuietLogger quiet;
    auto inputs = io::read_session_from_string(R"({ "detections": [ { "severity": 2 }, "junk" ] })");

    REQUIRE(inputs[0].detections.size() == 1);
    REQUIRE(inputs[0].detections[0].label.empty());
    REQUIRE(inputs[0].detections[0].severity == 2);
}

TEST_CASE("Reader parses analyses with projections", "[reader]") {
    auto inputs = io::read_session_from_string(R"({
        "analyses": [ {
            "damage_item": "Boiler",
            "severity": 3,
            "complete_data": { "Category": "Heating system" },
            "ten_year_projection": {
                "yearly_costs": [
                    { "year": 2, "cost": 450, "scheduled_work": "Burner service" },
                    { "year": 5, "cost": 0 },
                    { "year": 8, "cost": 3200, "notes": "Replace heat exchanger" },
                    { "year": 9, "cost": 75 }
                ],
                "summary": "Plan replacement."
            }
        } ]
    })");

    const AuthoritativeAnalysis& a = inputs.at(0).analyses.at(0);
    REQUIRE(a.damage_item == "Boiler");
    REQUIRE(a.severity == 3);
    REQUIRE(a.category == std::string("Heating system"));
    REQUIRE(a.summary == std::string("Plan replacement."));
    REQUIRE(a.yearly_costs.size() == 4);
    REQUIRE(a.yearly_costs[0] == YearlyCostRow(2, 450.0, "Burner service"));
    REQUIRE(a.yearly_costs[1] == YearlyCostRow(5, 0.0, NO_WORK_SCHEDULED));
    REQUIRE(a.yearly_costs[2].scheduled_work == "Replace heat exchanger");
    REQUIRE(a.yearly_costs[3].scheduled_work == "Scheduled work");
    REQUIRE_FALSE(a.repair_schedule.has_value());
}

TEST_CASE("Reader finds analyses nested in a result object", "[reader]") {
    auto inputs = io::read_session_from_string(R"({
        "result": { "analyses": [ { "damage_item": "Roof leak", "category": "Roofing" } ] }
    })");

    REQUIRE(inputs[0].analyses.size() == 1);
    REQUIRE(inputs[0].analyses[0].category == std::string("Roofing"));
    REQUIRE(inputs[0].analyses[0].yearly_costs.empty());
    REQUIRE_FALSE(inputs[0].analyses[0].summary.has_value());
}

TEST_CASE("Reader derives yearly rows from a repair schedule", "[reader][schedule]") {
    auto inputs = io::read_session_from_string(R"({
        "analyses": [ {
            "damage_item": "Pipe corrosion",
            "repair_schedule": {
                "next_repair_year": 3,
                "repair_type": "Re-pipe riser",
                "estimated_cost": 300,
                "additional_maintenance": [ { "year": 5, "type": "Inspection", "cost": 100 } ]
            }
        } ]
    })");

    const AuthoritativeAnalysis& a = inputs.at(0).analyses.at(0);
    REQUIRE(a.repair_schedule.has_value());
    REQUIRE(a.repair_schedule->next_repair_year == 3);
    REQUIRE(a.repair_schedule->additional_maintenance.size() == 1);
    REQUIRE(a.yearly_costs.size() == 10);
    REQUIRE_THAT(a.yearly_costs[2].cost, WithinAbs(393.13, 1e-9));
    REQUIRE_THAT(a.yearly_costs[4].cost, WithinAbs(143.10, 1e-9));
    REQUIRE(a.summary.has_value());
    REQUIRE(a.summary->find("Total of 2 ") == 0);
}

TEST_CASE("Reader uses the given schedule parameters", "[reader][schedule]") {
    ScheduleProjectionParams params;
    params.inflation_rate = 0.0;
    params.contingency_buffer = 0.0;
    params.years = 15;

    auto inputs = io::read_session_from_string(R"({
        "analyses": [ { "damage_item": "Roof", "repair_schedule": { "next_repair_year": 12, "estimated_cost": 1000 } } ]
    })", params);

    const AuthoritativeAnalysis& a = inputs.at(0).analyses.at(0);
    REQUIRE(a.yearly_costs.size() == 15);
    REQUIRE(a.yearly_costs[11] == YearlyCostRow(12, 1000.0, "Repair"));
}

TEST_CASE("Reader rejects unusable documents", "[reader]") {
    REQUIRE_THROWS_AS(io::read_session_from_string("not json"), InputParseError);
    REQUIRE_THROWS_AS(io::read_session_from_string("42"), InputParseError);
    REQUIRE_THROWS_AS(io::read_session_from_string(R"({"photos": "none"})"), InputParseError);
    REQUIRE_THROWS_AS(io::read_session_from_file("no_such_session.json"), InputParseError);
}

TEST_CASE("Reader loads the sample session", "[reader]") {
    auto inputs = io::read_session_from_file(std::string(REPAIRCAST_TEST_DATA_DIR) + "/sample_session.json");

    REQUIRE(inputs.size() == 3);
    REQUIRE(inputs[0].analyses.size() == 1);
    REQUIRE(inputs[1].id == "IMG_0002");
    REQUIRE(inputs[1].detections.empty());
    REQUIRE(inputs[2].detections[0].severity == 2);
    REQUIRE(inputs[2].analyses[0].yearly_costs.size() == 10);
}

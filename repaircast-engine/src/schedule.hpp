#ifndef REPAIRCAST_SCHEDULE_HPP
#define REPAIRCAST_SCHEDULE_HPP

#include "damage.hpp"
#include <string>
#include <vector>

namespace repaircast {

// One maintenance event in addition to the main repair
struct MaintenanceEvent {
    int year;
    std::string type;
    double cost;

    MaintenanceEvent();
    MaintenanceEvent(int event_year, std::string event_type, double event_cost);
};

// Pricing backend's plan for a damage item
struct RepairSchedule {
    int next_repair_year;           // Year of the main repair (0 = none scheduled)
    std::string repair_type;
    double estimated_cost;
    std::vector<MaintenanceEvent> additional_maintenance;

    RepairSchedule();
};

// Configuration for turning a schedule into yearly rows
struct ScheduleProjectionParams {
    double inflation_rate;          // Annual cost inflation (default 4.5%)
    double contingency_buffer;      // Markup for unforeseen costs (default 20%)
    int years;                      // Projection length, clamped to 1..15 (default 10)

    ScheduleProjectionParams();
};

struct ScheduleProjection {
    YearlySeries yearly_costs;      // Years 1..years
    double total;                   // Sum of yearly costs, rounded to cents
    std::string summary;

    ScheduleProjection();
};

// Project a repair schedule into yearly cost rows.
//
// Events falling in year 1..years are collected per year; a second event in
// the same year adds its cost and appends " + <type>" to the work text.
// Each event year costs:
//   cost × (1 + contingency_buffer) × (1 + inflation_rate)^(year - 1)
// rounded to cents. Years with no event cost 0 ("No work scheduled").
ScheduleProjection project_repair_schedule(
    const RepairSchedule& schedule,
    const ScheduleProjectionParams& params = ScheduleProjectionParams()
);

} // namespace repaircast

#endif // REPAIRCAST_SCHEDULE_HPP

#include "schedule.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>

namespace repaircast {

namespace {

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Format a rate as a percentage without trailing zeros (0.045 -> "4.5")
std::string format_percent(double rate) {
    std::ostringstream oss;
    oss << round_cents(rate * 100.0);
    return oss.str();
}

struct ScheduledEvent {
    std::string type;
    double cost;
};

} // anonymous namespace

MaintenanceEvent::MaintenanceEvent() : year(0), type("Maintenance"), cost(0.0) {}

MaintenanceEvent::MaintenanceEvent(int event_year, std::string event_type, double event_cost)
    : year(event_year), type(std::move(event_type)), cost(event_cost) {}

RepairSchedule::RepairSchedule()
    : next_repair_year(0), repair_type("Repair"), estimated_cost(0.0) {}

ScheduleProjectionParams::ScheduleProjectionParams()
    : inflation_rate(0.045), contingency_buffer(0.20), years(10) {}

ScheduleProjection::ScheduleProjection() : total(0.0) {}

ScheduleProjection project_repair_schedule(
    const RepairSchedule& schedule,
    const ScheduleProjectionParams& params)
{
    const int years = std::clamp(params.years, 1, MAX_YEAR);

    std::map<int, ScheduledEvent> events;
    if (schedule.next_repair_year > 0 && schedule.next_repair_year <= years) {
        events[schedule.next_repair_year] = ScheduledEvent{
            schedule.repair_type, std::max(0.0, schedule.estimated_cost)};
    }

    for (const auto& maint : schedule.additional_maintenance) {
        if (maint.year <= 0 || maint.year > years) {
            continue;
        }
        double cost = std::max(0.0, maint.cost);
        auto it = events.find(maint.year);
        if (it != events.end()) {
            it->second.cost += cost;
            it->second.type += " + " + maint.type;
        } else {
            events[maint.year] = ScheduledEvent{maint.type, cost};
        }
    }

    ScheduleProjection projection;
    projection.yearly_costs.reserve(static_cast<size_t>(years));

    double cumulative = 0.0;
    int event_count = 0;
    for (int year = 1; year <= years; ++year) {
        auto it = events.find(year);
        if (it == events.end()) {
            projection.yearly_costs.emplace_back(year, 0.0, NO_WORK_SCHEDULED);
            continue;
        }

        double base_cost = it->second.cost * (1.0 + params.contingency_buffer);
        double inflated = round_cents(base_cost * std::pow(1.0 + params.inflation_rate, year - 1));
        cumulative += inflated;
        if (inflated > 0.0) {
            ++event_count;
        }
        projection.yearly_costs.emplace_back(year, inflated, it->second.type);
    }

    projection.total = round_cents(cumulative);

    std::ostringstream summary;
    summary << "Total of " << event_count << " maintenance/repair event(s) scheduled over "
            << years << " years. Costs include " << format_percent(params.inflation_rate)
            << "% annual inflation and " << format_percent(params.contingency_buffer)
            << "% contingency buffer for conservative planning.";
    projection.summary = summary.str();

    return projection;
}

} // namespace repaircast

#ifndef REPAIRCAST_DRILLDOWN_HPP
#define REPAIRCAST_DRILLDOWN_HPP

#include "portfolio.hpp"
#include "profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace repaircast {

// ----------------------------------------------------------------------------
// Horizon drill-down: what makes up the cost through a chosen year
// ----------------------------------------------------------------------------

struct YearBreakdown {
    int year;
    double total;                           // All photos, all profiles
    std::vector<SystemCost> by_system;      // Grouped by label, first-seen order
};

struct DistributionEntry {
    std::string label;
    double value;                           // Cumulative cost through the horizon
    double share;                           // value / grand_total
};

struct HorizonDrillDown {
    int horizon_year;
    std::vector<YearBreakdown> years;               // Years 1..horizon_year
    std::vector<DistributionEntry> distribution;    // Positive entries, descending
    double grand_total;                             // Sum of distribution values

    HorizonDrillDown();
};

// Returns std::nullopt when there are no photos or horizon_year is outside 1..15
std::optional<HorizonDrillDown> drill_down_horizon(
    const std::vector<ProcessedPhoto>& photos,
    int horizon_year
);

// ----------------------------------------------------------------------------
// System drill-down: one label across every photo
// ----------------------------------------------------------------------------

// A single photo's share of a system cost in one year
struct InstanceContribution {
    std::string photo_id;
    std::string file_name;
    double cost;
    std::string scheduled_work;
};

struct SystemYear {
    int year;
    double total;
    std::vector<InstanceContribution> contributions;  // Instances with a positive cost that year
};

struct SystemInstance {
    std::string photo_id;
    std::string file_name;
    int severity;
    std::string category;
    double total_cost;                      // 15-year horizon total
};

struct SystemDrillDown {
    std::string label;
    std::vector<SystemInstance> instances;
    std::vector<SystemYear> years;          // Years 1..15
    double total_cost;                      // Sum of instance totals
    int average_severity;                   // Rounded mean over instances

    SystemDrillDown();
};

// Returns std::nullopt when no profile carries the label
std::optional<SystemDrillDown> drill_down_system(
    const std::vector<ProcessedPhoto>& photos,
    const std::string& label
);

} // namespace repaircast

#endif // REPAIRCAST_DRILLDOWN_HPP

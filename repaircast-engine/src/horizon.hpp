#ifndef REPAIRCAST_HORIZON_HPP
#define REPAIRCAST_HORIZON_HPP

#include "damage.hpp"
#include <vector>

namespace repaircast {

// Cumulative totals at the fixed report horizons plus the rendering denominators
struct HorizonSummary {
    std::vector<HorizonTotal> horizons;  // Years 5, 10, 15 in ascending order
    double max_horizon;                  // max(all horizon totals, 1)
    double max_yearly;                   // max(all yearly costs, 1)

    HorizonSummary();
};

// Reduce a yearly series to rounded cumulative totals at HORIZON_YEARS.
// Totals are non-decreasing because costs are non-negative.
HorizonSummary summarize_horizons(const YearlySeries& series);

// Rounded cumulative total through each year 1..15, for charting
std::vector<HorizonTotal> cumulative_series(const YearlySeries& series);

// Sum of costs for rows with year <= through_year (unrounded)
double cumulative_cost(const YearlySeries& series, int through_year);

} // namespace repaircast

#endif // REPAIRCAST_HORIZON_HPP

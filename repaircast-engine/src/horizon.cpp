#include "horizon.hpp"
#include <algorithm>
#include <cmath>

namespace repaircast {

HorizonSummary::HorizonSummary() : max_horizon(1.0), max_yearly(1.0) {}

double cumulative_cost(const YearlySeries& series, int through_year) {
    double sum = 0.0;
    for (const auto& row : series) {
        if (row.year <= through_year) {
            sum += row.cost;
        }
    }
    return sum;
}

HorizonSummary summarize_horizons(const YearlySeries& series) {
    HorizonSummary summary;
    summary.horizons.reserve(HORIZON_YEARS.size());

    for (int horizon_year : HORIZON_YEARS) {
        double total = std::round(cumulative_cost(series, horizon_year));
        summary.horizons.push_back(HorizonTotal{horizon_year, total});
        summary.max_horizon = std::max(summary.max_horizon, total);
    }

    for (const auto& row : series) {
        summary.max_yearly = std::max(summary.max_yearly, row.cost);
    }

    return summary;
}

std::vector<HorizonTotal> cumulative_series(const YearlySeries& series) {
    std::vector<HorizonTotal> points;
    points.reserve(MAX_YEAR);

    double running = 0.0;
    for (int year = 1; year <= MAX_YEAR; ++year) {
        for (const auto& row : series) {
            if (row.year == year) {
                running += row.cost;
            }
        }
        points.push_back(HorizonTotal{year, std::round(running)});
    }
    return points;
}

} // namespace repaircast

#ifndef REPAIRCAST_PORTFOLIO_HPP
#define REPAIRCAST_PORTFOLIO_HPP

#include "profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace repaircast {

// A system (damage label) and an aggregated cost
struct SystemCost {
    std::string label;
    double value;

    bool operator==(const SystemCost& other) const {
        return label == other.label && value == other.value;
    }
};

// Portfolio-wide view across every processed photo
struct PortfolioReport {
    std::vector<HorizonTotal> totals;       // Years 5, 10, 15
    std::vector<SystemCost> top_systems;    // Descending by 15-year cost, at most top_n
    std::vector<HorizonTotal> yearly;       // Cost per year 1..15
    std::vector<HorizonTotal> cumulative;   // Running total per year 1..15
    size_t photo_count;
    size_t profile_count;

    PortfolioReport();

    double total_at(int horizon_year) const;
};

constexpr size_t DEFAULT_TOP_SYSTEMS = 3;

// Group profiles across all photos by label and sum their 15-year totals.
// Groups are returned in first-seen order.
std::vector<SystemCost> group_by_system(const std::vector<ProcessedPhoto>& photos);

// Derive the portfolio report from the current photos.
//
// totals[h]   = sum over photos, over profiles, of the profile's horizon total at h
// top_systems = group_by_system sorted descending (stable, so ties keep
//               first-seen order), truncated to top_n
//
// Returns std::nullopt when there are no photos.
std::optional<PortfolioReport> build_portfolio_report(
    const std::vector<ProcessedPhoto>& photos,
    size_t top_n = DEFAULT_TOP_SYSTEMS
);

} // namespace repaircast

#endif // REPAIRCAST_PORTFOLIO_HPP

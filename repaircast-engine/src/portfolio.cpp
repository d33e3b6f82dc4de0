#include "portfolio.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace repaircast {

PortfolioReport::PortfolioReport() : photo_count(0), profile_count(0) {}

double PortfolioReport::total_at(int horizon_year) const {
    for (const auto& t : totals) {
        if (t.year == horizon_year) {
            return t.total;
        }
    }
    return 0.0;
}

std::vector<SystemCost> group_by_system(const std::vector<ProcessedPhoto>& photos) {
    const int full_horizon = HORIZON_YEARS.back();

    std::vector<SystemCost> groups;
    std::unordered_map<std::string, size_t> slot_by_label;

    for (const auto& photo : photos) {
        for (const auto& profile : photo.cost_profiles) {
            auto [it, inserted] = slot_by_label.emplace(profile.label, groups.size());
            if (inserted) {
                groups.push_back(SystemCost{profile.label, 0.0});
            }
            groups[it->second].value += profile.horizon_total(full_horizon);
        }
    }
    return groups;
}

std::optional<PortfolioReport> build_portfolio_report(
    const std::vector<ProcessedPhoto>& photos,
    size_t top_n)
{
    if (photos.empty()) {
        return std::nullopt;
    }

    PortfolioReport report;
    report.photo_count = photos.size();

    // Horizon totals: reduce profiles within each photo, then photos
    for (int horizon_year : HORIZON_YEARS) {
        double portfolio_total = 0.0;
        for (const auto& photo : photos) {
            double photo_total = 0.0;
            for (const auto& profile : photo.cost_profiles) {
                photo_total += profile.horizon_total(horizon_year);
            }
            portfolio_total += photo_total;
        }
        report.totals.push_back(HorizonTotal{horizon_year, portfolio_total});
    }

    // Chart series
    double running = 0.0;
    for (int year = 1; year <= MAX_YEAR; ++year) {
        double year_total = 0.0;
        for (const auto& photo : photos) {
            for (const auto& profile : photo.cost_profiles) {
                year_total += profile.cost_in_year(year);
            }
        }
        running += year_total;
        report.yearly.push_back(HorizonTotal{year, std::round(year_total)});
        report.cumulative.push_back(HorizonTotal{year, std::round(running)});
    }

    for (const auto& photo : photos) {
        report.profile_count += photo.cost_profiles.size();
    }

    std::vector<SystemCost> systems = group_by_system(photos);
    std::stable_sort(systems.begin(), systems.end(), [](const SystemCost& a, const SystemCost& b) {
        return a.value > b.value;
    });
    if (systems.size() > top_n) {
        systems.resize(top_n);
    }
    report.top_systems = std::move(systems);

    return report;
}

} // namespace repaircast

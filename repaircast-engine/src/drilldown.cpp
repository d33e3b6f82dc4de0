#include "drilldown.hpp"
#include "horizon.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace repaircast {

HorizonDrillDown::HorizonDrillDown() : horizon_year(0), grand_total(0.0) {}

SystemDrillDown::SystemDrillDown() : total_cost(0.0), average_severity(DEFAULT_SEVERITY) {}

// ============================================================================
// Horizon drill-down
// ============================================================================

std::optional<HorizonDrillDown> drill_down_horizon(
    const std::vector<ProcessedPhoto>& photos,
    int horizon_year)
{
    if (photos.empty() || horizon_year < 1 || horizon_year > MAX_YEAR) {
        return std::nullopt;
    }

    HorizonDrillDown drill;
    drill.horizon_year = horizon_year;
    drill.years.reserve(static_cast<size_t>(horizon_year));

    for (int year = 1; year <= horizon_year; ++year) {
        YearBreakdown breakdown{year, 0.0, {}};
        std::unordered_map<std::string, size_t> slot_by_label;

        for (const auto& photo : photos) {
            for (const auto& profile : photo.cost_profiles) {
                double cost = profile.cost_in_year(year);
                breakdown.total += cost;

                auto [it, inserted] = slot_by_label.emplace(profile.label, breakdown.by_system.size());
                if (inserted) {
                    breakdown.by_system.push_back(SystemCost{profile.label, 0.0});
                }
                breakdown.by_system[it->second].value += cost;
            }
        }
        drill.years.push_back(std::move(breakdown));
    }

    // Distribution of cumulative cost through the horizon, per system
    std::vector<SystemCost> systems;
    std::unordered_map<std::string, size_t> slot_by_label;
    for (const auto& photo : photos) {
        for (const auto& profile : photo.cost_profiles) {
            auto [it, inserted] = slot_by_label.emplace(profile.label, systems.size());
            if (inserted) {
                systems.push_back(SystemCost{profile.label, 0.0});
            }
            systems[it->second].value += cumulative_cost(profile.yearly_series, horizon_year);
        }
    }

    std::stable_sort(systems.begin(), systems.end(), [](const SystemCost& a, const SystemCost& b) {
        return a.value > b.value;
    });

    for (const auto& system : systems) {
        if (system.value > 0.0) {
            drill.grand_total += system.value;
        }
    }
    for (const auto& system : systems) {
        if (system.value <= 0.0) {
            continue;
        }
        double share = drill.grand_total > 0.0 ? system.value / drill.grand_total : 0.0;
        drill.distribution.push_back(DistributionEntry{system.label, system.value, share});
    }

    return drill;
}

// ============================================================================
// System drill-down
// ============================================================================

std::optional<SystemDrillDown> drill_down_system(
    const std::vector<ProcessedPhoto>& photos,
    const std::string& label)
{
    struct Match {
        const ProcessedPhoto* photo;
        const CostProfile* profile;
    };

    std::vector<Match> matches;
    for (const auto& photo : photos) {
        for (const auto& profile : photo.cost_profiles) {
            if (profile.label == label) {
                matches.push_back(Match{&photo, &profile});
            }
        }
    }

    if (matches.empty()) {
        return std::nullopt;
    }

    SystemDrillDown drill;
    drill.label = label;

    for (int year = 1; year <= MAX_YEAR; ++year) {
        SystemYear system_year{year, 0.0, {}};
        for (const auto& match : matches) {
            double cost = match.profile->cost_in_year(year);
            system_year.total += cost;
            if (cost > 0.0) {
                const auto& row = match.profile->yearly_series[static_cast<size_t>(year - 1)];
                system_year.contributions.push_back(InstanceContribution{
                    match.photo->id, match.photo->file_name, cost, row.scheduled_work});
            }
        }
        drill.years.push_back(std::move(system_year));
    }

    double severity_sum = 0.0;
    for (const auto& match : matches) {
        double instance_total = match.profile->horizon_total(HORIZON_YEARS.back());
        drill.instances.push_back(SystemInstance{
            match.photo->id,
            match.photo->file_name,
            match.profile->severity,
            match.profile->category,
            instance_total});
        drill.total_cost += instance_total;
        severity_sum += match.profile->severity;
    }

    drill.average_severity = static_cast<int>(std::round(severity_sum / static_cast<double>(matches.size())));

    return drill;
}

} // namespace repaircast

#include "series_merger.hpp"
#include <array>
#include <cmath>

namespace repaircast {

YearlySeries merge_series(const YearlySeries& synthetic, const YearlySeries& authoritative) {
    // Index the baseline by year so a misordered input still yields 1..15
    std::array<const YearlyCostRow*, MAX_YEAR> base{};
    for (const auto& row : synthetic) {
        if (row.year >= 1 && row.year <= MAX_YEAR && !base[row.year - 1]) {
            base[row.year - 1] = &row;
        }
    }

    std::array<const YearlyCostRow*, MAX_YEAR> overrides{};
    for (const auto& row : authoritative) {
        if (row.year < 1 || row.year > MAX_YEAR) {
            continue;
        }
        if (!(row.cost > 0.0) || !std::isfinite(row.cost)) {
            continue;
        }
        if (!overrides[row.year - 1]) {
            overrides[row.year - 1] = &row;
        }
    }

    YearlySeries merged;
    merged.reserve(MAX_YEAR);
    for (int year = 1; year <= MAX_YEAR; ++year) {
        const YearlyCostRow* chosen = overrides[year - 1] ? overrides[year - 1] : base[year - 1];
        if (overrides[year - 1]) {
            // Backend and schedule costs may carry cents; profiles hold whole units
            merged.emplace_back(year, std::round(chosen->cost), chosen->scheduled_work);
        } else if (chosen) {
            merged.emplace_back(year, chosen->cost, chosen->scheduled_work);
        } else {
            merged.emplace_back(year, 0.0, NO_WORK_SCHEDULED);
        }
    }
    return merged;
}

} // namespace repaircast

#include "synthetic_series.hpp"
#include "seed.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace repaircast {

namespace {

constexpr double YEAR_PHASE = 12.9898;
constexpr uint64_t SEVERITY_SEED_STRIDE = 97;
constexpr uint64_t TEMPLATE_SEED_STRIDE = 37;

bool is_horizon_year(int year) {
    return std::find(HORIZON_YEARS.begin(), HORIZON_YEARS.end(), year) != HORIZON_YEARS.end();
}

} // anonymous namespace

YearlySeries generate_synthetic_series(const std::string& label, int severity) {
    const int sev = clamp_severity(severity);
    const std::string seed_label = label.empty() ? std::string("damage") : label;
    const uint64_t seed = seed_from_string(seed_label, static_cast<uint64_t>(sev) * SEVERITY_SEED_STRIDE);

    const double base_cost = 700.0 + sev * 450.0;
    const int recurrence = std::max(2, 6 - sev);

    YearlySeries series;
    series.reserve(MAX_YEAR);

    for (int year = 1; year <= MAX_YEAR; ++year) {
        double noise = std::fabs(std::sin(static_cast<double>(seed) + year * YEAR_PHASE));

        double cost = 0.0;
        if (is_horizon_year(year)) {
            cost = base_cost * (1.1 + noise * 0.6 + sev * 0.15);
        } else if (noise > 0.85 || year % recurrence == 0) {
            cost = base_cost * 0.35 * (0.5 + noise);
        }
        cost = std::round(cost);

        std::string work;
        if (cost == 0.0) {
            work = NO_WORK_SCHEDULED;
        } else if (year % 5 == 0) {
            work = "Planned intervention";
        } else {
            work = "Condition-based service";
        }

        series.emplace_back(year, cost, std::move(work));
    }

    return series;
}

// ============================================================================
// Fallback Items
// ============================================================================

FallbackItemParams::FallbackItemParams()
    : min_detections(2),
      target_items(3),
      templates{"Building envelope", "Utilities & fixtures", "Interior surfaces"} {}

bool is_usable_detection(const DamageItem& item) {
    return std::any_of(item.label.begin(), item.label.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
}

PaddedItems pad_with_fallback_items(
    const std::string& file_name,
    const std::vector<DamageItem>& detections,
    const FallbackItemParams& params)
{
    PaddedItems result;
    result.items = detections;

    size_t usable = static_cast<size_t>(
        std::count_if(detections.begin(), detections.end(), is_usable_detection));
    if (usable >= params.min_detections) {
        return result;
    }

    const uint64_t file_seed = seed_from_string(file_name);
    size_t template_index = 0;
    while (result.items.size() < params.target_items && template_index < params.templates.size()) {
        uint64_t mixed = file_seed + template_index * TEMPLATE_SEED_STRIDE;
        int severity = static_cast<int>(mixed % 5) + 1;
        result.items.emplace_back(params.templates[template_index], severity);
        ++result.synthetic_count;
        ++template_index;
    }

    return result;
}

} // namespace repaircast

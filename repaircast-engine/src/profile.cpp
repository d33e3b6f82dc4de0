#include "profile.hpp"
#include "series_merger.hpp"

namespace repaircast {

const char* const DEFAULT_CATEGORY_UNMATCHED = "General system";
const char* const DEFAULT_CATEGORY_MATCHED = "Building component";
const char* const DEFAULT_SUMMARY = "No major maintenance expected.";

// ============================================================================
// CostProfile Implementation
// ============================================================================

CostProfile::CostProfile()
    : severity(DEFAULT_SEVERITY),
      max_horizon(1.0),
      max_yearly(1.0),
      authoritative(false),
      synthetic_item(false) {}

double CostProfile::horizon_total(int year) const {
    for (const auto& h : horizons) {
        if (h.year == year) {
            return h.total;
        }
    }
    return 0.0;
}

double CostProfile::cost_in_year(int year) const {
    if (year < 1 || year > static_cast<int>(yearly_series.size())) {
        return 0.0;
    }
    // yearly_series is dense and ordered, so year N sits at index N-1
    return yearly_series[static_cast<size_t>(year - 1)].cost;
}

// ============================================================================
// Profile Builder
// ============================================================================

CostProfile build_cost_profile(
    const DamageItem& item,
    const AnalysisIndex& analyses,
    size_t position)
{
    CostProfile profile;
    profile.severity = clamp_severity(item.severity);

    const bool usable = is_usable_detection(item);
    if (usable) {
        profile.label = item.label;
    } else {
        profile.label = "Damage item " + std::to_string(position + 1);
    }

    const AuthoritativeAnalysis* match = analyses.find(item.label);
    profile.authoritative = match != nullptr;

    YearlySeries synthetic = generate_synthetic_series(
        usable ? item.label : std::string(), profile.severity);
    if (match) {
        profile.yearly_series = merge_series(synthetic, match->yearly_costs);
    } else {
        profile.yearly_series = merge_series(synthetic, YearlySeries());
    }

    HorizonSummary summary = summarize_horizons(profile.yearly_series);
    profile.horizons = std::move(summary.horizons);
    profile.max_horizon = summary.max_horizon;
    profile.max_yearly = summary.max_yearly;

    if (match && match->category && !match->category->empty()) {
        profile.category = *match->category;
    } else {
        profile.category = match ? DEFAULT_CATEGORY_MATCHED : DEFAULT_CATEGORY_UNMATCHED;
    }

    if (match && match->summary && !match->summary->empty()) {
        profile.summary = *match->summary;
    } else {
        profile.summary = DEFAULT_SUMMARY;
    }

    return profile;
}

CostProfile build_cost_profile(
    const DamageItem& item,
    const std::vector<AuthoritativeAnalysis>& analyses,
    size_t position)
{
    return build_cost_profile(item, AnalysisIndex(analyses), position);
}

std::vector<CostProfile> build_photo_profiles(
    const std::string& file_name,
    const std::vector<DamageItem>& detections,
    const std::vector<AuthoritativeAnalysis>& analyses,
    const FallbackItemParams& fallback)
{
    PaddedItems padded = pad_with_fallback_items(file_name, detections, fallback);
    AnalysisIndex index(analyses);

    const size_t first_synthetic = padded.items.size() - padded.synthetic_count;

    std::vector<CostProfile> profiles;
    profiles.reserve(padded.items.size());
    for (size_t i = 0; i < padded.items.size(); ++i) {
        CostProfile profile = build_cost_profile(padded.items[i], index, i);
        profile.synthetic_item = i >= first_synthetic;
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

} // namespace repaircast

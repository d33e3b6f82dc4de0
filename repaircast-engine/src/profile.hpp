#ifndef REPAIRCAST_PROFILE_HPP
#define REPAIRCAST_PROFILE_HPP

#include "analysis.hpp"
#include "damage.hpp"
#include "horizon.hpp"
#include "synthetic_series.hpp"
#include <string>
#include <vector>

namespace repaircast {

extern const char* const DEFAULT_CATEGORY_UNMATCHED;   // "General system"
extern const char* const DEFAULT_CATEGORY_MATCHED;     // "Building component"
extern const char* const DEFAULT_SUMMARY;              // "No major maintenance expected."

// Complete cost projection for one damage item
struct CostProfile {
    std::string label;
    int severity;
    std::string category;
    YearlySeries yearly_series;             // Exactly years 1..15 in order
    std::vector<HorizonTotal> horizons;     // Years 5, 10, 15 in order
    double max_horizon;                     // >= 1
    double max_yearly;                      // >= 1
    std::string summary;
    bool authoritative;                     // An analysis matched this item
    bool synthetic_item;                    // Item came from fallback padding

    CostProfile();

    // Horizon total at the given report year, 0 when year is not a horizon
    double horizon_total(int year) const;

    // Cost in a single projection year, 0 when out of range
    double cost_in_year(int year) const;
};

// A processed photo and its profiles. Profiles are replaced wholesale on
// reprocessing, never edited in place.
struct ProcessedPhoto {
    std::string id;
    std::string file_name;
    std::vector<CostProfile> cost_profiles;
};

// Build a single profile.
//
// 1. Match the item against the analyses (case-insensitive label)
// 2. Generate the synthetic baseline from label and severity
// 3. Merge the matched analysis' yearly rows over the baseline
// 4. Summarize horizons
// 5-6. Category and summary from the analysis, else fixed defaults
//
// position is the item's index within its photo; a blank label becomes
// "Damage item <position + 1>" so unlabeled items stay distinguishable.
CostProfile build_cost_profile(
    const DamageItem& item,
    const AnalysisIndex& analyses,
    size_t position
);

CostProfile build_cost_profile(
    const DamageItem& item,
    const std::vector<AuthoritativeAnalysis>& analyses,
    size_t position
);

// Build all profiles for one photo, padding sparse detections with
// placeholder items first.
std::vector<CostProfile> build_photo_profiles(
    const std::string& file_name,
    const std::vector<DamageItem>& detections,
    const std::vector<AuthoritativeAnalysis>& analyses,
    const FallbackItemParams& fallback = FallbackItemParams()
);

} // namespace repaircast

#endif // REPAIRCAST_PROFILE_HPP

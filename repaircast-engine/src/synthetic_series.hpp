#ifndef REPAIRCAST_SYNTHETIC_SERIES_HPP
#define REPAIRCAST_SYNTHETIC_SERIES_HPP

#include "damage.hpp"
#include <string>
#include <vector>

namespace repaircast {

// Generate the deterministic 15-year placeholder series for a damage item.
//
// seed     = seed_from_string(label or "damage", severity * 97)
// baseCost = 700 + severity * 450
// For each year, noise = |sin(seed + year * 12.9898)|:
//   - horizon years (5, 10, 15) always carry an event:
//       baseCost * (1.1 + noise * 0.6 + severity * 0.15)
//   - other years carry a maintenance event when noise > 0.85 or
//     year % max(2, 6 - severity) == 0:
//       baseCost * 0.35 * (0.5 + noise)
//   - otherwise the year is empty
// Costs are rounded to whole currency units.
//
// Severity is clamped to [1,5] before use.
YearlySeries generate_synthetic_series(const std::string& label, int severity);

// Parameters for padding sparse detections with placeholder items
struct FallbackItemParams {
    size_t min_detections;              // Pad when fewer usable detections than this
    size_t target_items;                // Pad up to this many items in total
    std::vector<std::string> templates; // Placeholder labels, used in order

    FallbackItemParams();
};

// Items for one photo after fallback padding.
// Real detections come first and are never dropped; the last
// synthetic_count entries are placeholders.
struct PaddedItems {
    std::vector<DamageItem> items;
    size_t synthetic_count;

    PaddedItems() : synthetic_count(0) {}
};

// A detection is usable when its label is not blank
bool is_usable_detection(const DamageItem& item);

// Pad detections with placeholder items when detection is sparse.
// Placeholder severity = ((seed_from_string(file_name) + template_index * 37) % 5) + 1
PaddedItems pad_with_fallback_items(
    const std::string& file_name,
    const std::vector<DamageItem>& detections,
    const FallbackItemParams& params = FallbackItemParams()
);

} // namespace repaircast

#endif // REPAIRCAST_SYNTHETIC_SERIES_HPP

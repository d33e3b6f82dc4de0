#ifndef REPAIRCAST_DAMAGE_HPP
#define REPAIRCAST_DAMAGE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace repaircast {

// Projection window: years 1..15
constexpr int MAX_YEAR = 15;

// Fixed report horizons (cumulative totals are reported at these years)
constexpr std::array<int, 3> HORIZON_YEARS = {5, 10, 15};

constexpr int MIN_SEVERITY = 1;
constexpr int MAX_SEVERITY = 5;
constexpr int DEFAULT_SEVERITY = 3;

extern const char* const NO_WORK_SCHEDULED;

// Clamp an integer severity into [1,5]
int clamp_severity(long long severity);

// Parse a severity from free text.
// A leading integer (after optional whitespace and sign) is clamped to [1,5];
// anything else yields DEFAULT_SEVERITY.
int parse_severity(const std::string& text);

// A detected or synthesized building defect
struct DamageItem {
    std::string label;
    int severity;

    DamageItem();
    DamageItem(std::string item_label, int item_severity);

    bool operator==(const DamageItem& other) const;
};

// One year of a cost projection
struct YearlyCostRow {
    int year;
    double cost;                    // Non-negative, in whole currency units for engine output
    std::string scheduled_work;

    YearlyCostRow();
    YearlyCostRow(int row_year, double row_cost, std::string work);

    bool operator==(const YearlyCostRow& other) const;
};

// A cumulative total reported at a given year
struct HorizonTotal {
    int year;
    double total;

    bool operator==(const HorizonTotal& other) const {
        return year == other.year && total == other.total;
    }
};

using YearlySeries = std::vector<YearlyCostRow>;

} // namespace repaircast

#endif // REPAIRCAST_DAMAGE_HPP

#include "damage.hpp"
#include <algorithm>
#include <cctype>

namespace repaircast {

const char* const NO_WORK_SCHEDULED = "No work scheduled";

int clamp_severity(long long severity) {
    if (severity < MIN_SEVERITY) {
        return MIN_SEVERITY;
    }
    if (severity > MAX_SEVERITY) {
        return MAX_SEVERITY;
    }
    return static_cast<int>(severity);
}

int parse_severity(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }

    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
        return DEFAULT_SEVERITY;
    }

    // Only the clamped value matters, so stop accumulating once out of range
    long long value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (value < 1000) {
            value = value * 10 + (text[pos] - '0');
        }
        ++pos;
    }

    return clamp_severity(negative ? -value : value);
}

// ============================================================================
// DamageItem Implementation
// ============================================================================

DamageItem::DamageItem() : severity(DEFAULT_SEVERITY) {}

DamageItem::DamageItem(std::string item_label, int item_severity)
    : label(std::move(item_label)), severity(clamp_severity(item_severity)) {}

bool DamageItem::operator==(const DamageItem& other) const {
    return label == other.label && severity == other.severity;
}

// ============================================================================
// YearlyCostRow Implementation
// ============================================================================

YearlyCostRow::YearlyCostRow() : year(0), cost(0.0), scheduled_work(NO_WORK_SCHEDULED) {}

YearlyCostRow::YearlyCostRow(int row_year, double row_cost, std::string work)
    : year(row_year), cost(std::max(0.0, row_cost)), scheduled_work(std::move(work)) {}

bool YearlyCostRow::operator==(const YearlyCostRow& other) const {
    return year == other.year &&
           cost == other.cost &&
           scheduled_work == other.scheduled_work;
}

} // namespace repaircast

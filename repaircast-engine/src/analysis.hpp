#ifndef REPAIRCAST_ANALYSIS_HPP
#define REPAIRCAST_ANALYSIS_HPP

#include "damage.hpp"
#include "schedule.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace repaircast {

// Backend-supplied pricing for one damage item. Every field but the item
// name is optional; yearly_costs may be sparse or empty.
struct AuthoritativeAnalysis {
    std::string damage_item;
    std::optional<int> severity;
    std::optional<std::string> category;
    YearlySeries yearly_costs;
    std::optional<std::string> summary;
    std::optional<RepairSchedule> repair_schedule;
};

// Lowercase and trim a label for case-insensitive matching
std::string normalize_label(const std::string& label);

// Case-insensitive lookup of analyses by damage item name.
// When two analyses normalize to the same key, the first one wins.
// The index points into the vector it was built from, which must outlive it.
class AnalysisIndex {
public:
    AnalysisIndex() = default;
    explicit AnalysisIndex(const std::vector<AuthoritativeAnalysis>& analyses);

    // Returns nullptr when no analysis matches
    const AuthoritativeAnalysis* find(const std::string& label) const;

    size_t size() const { return by_label_.size(); }
    bool empty() const { return by_label_.empty(); }

private:
    std::unordered_map<std::string, const AuthoritativeAnalysis*> by_label_;
};

} // namespace repaircast

#endif // REPAIRCAST_ANALYSIS_HPP

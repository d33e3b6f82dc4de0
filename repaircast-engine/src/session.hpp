#ifndef REPAIRCAST_SESSION_HPP
#define REPAIRCAST_SESSION_HPP

#include "analysis.hpp"
#include "damage.hpp"
#include "drilldown.hpp"
#include "engine_config.hpp"
#include "portfolio.hpp"
#include "profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace repaircast {

// One photo as handed over by the detection/pricing collaborator
struct PhotoInput {
    std::string id;
    std::string file_name;
    std::vector<DamageItem> detections;
    std::vector<AuthoritativeAnalysis> analyses;
};

// Everything derived from one session snapshot
struct SessionReport {
    std::vector<ProcessedPhoto> photos;
    std::optional<PortfolioReport> portfolio;
    std::optional<HorizonDrillDown> horizon_drill_down;
    std::optional<SystemDrillDown> system_drill_down;
};

// Build the profiles for one photo and log the outcome
ProcessedPhoto process_photo(const PhotoInput& input, const EngineConfig& config);

// Process every photo in order
std::vector<ProcessedPhoto> process_session(
    const std::vector<PhotoInput>& inputs,
    const EngineConfig& config
);

// Process photos and derive the portfolio plus any requested drill-downs.
// horizon_year / system_label select the drill-downs; leave them empty to skip.
SessionReport build_session_report(
    const std::vector<PhotoInput>& inputs,
    const EngineConfig& config,
    std::optional<int> horizon_year = std::nullopt,
    std::optional<std::string> system_label = std::nullopt
);

} // namespace repaircast

#endif // REPAIRCAST_SESSION_HPP

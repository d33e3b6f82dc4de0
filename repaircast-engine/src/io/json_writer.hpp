#ifndef REPAIRCAST_IO_JSON_WRITER_HPP
#define REPAIRCAST_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../session.hpp"

namespace repaircast {
namespace io {

// Chart-ready JSON views of the engine structures
nlohmann::json profile_to_json(const CostProfile& profile);
nlohmann::json portfolio_to_json(const PortfolioReport& report);
nlohmann::json horizon_drill_down_to_json(const HorizonDrillDown& drill);
nlohmann::json system_drill_down_to_json(const SystemDrillDown& drill);

// Full report: { "portfolio", "photos", "horizon_drill_down"?, "system_drill_down"? }
// portfolio is null when there are no photos.
nlohmann::json session_report_to_json(const SessionReport& report);

// Write SessionReport to JSON format
void write_session_report_json(std::ostream& os, const SessionReport& report,
                               bool pretty_print = true);

// Write SessionReport to JSON file
void write_session_report_json(const std::string& filepath, const SessionReport& report,
                               bool pretty_print = true);

} // namespace io
} // namespace repaircast

#endif // REPAIRCAST_IO_JSON_WRITER_HPP

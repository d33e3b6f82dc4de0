#ifndef REPAIRCAST_IO_TEXT_REPORT_HPP
#define REPAIRCAST_IO_TEXT_REPORT_HPP

#include <ostream>
#include "../portfolio.hpp"
#include "../profile.hpp"

namespace repaircast {
namespace io {

// Fixed-width 15-year cost table for one profile:
//   Year | Scheduled Work | Cost | Cumulative
// followed by the horizon totals and the summary line. The formatting
// state of the caller's stream is left untouched.
void write_cost_table(std::ostream& os, const CostProfile& profile);

// Horizon totals and top cost drivers
void write_portfolio_summary(std::ostream& os, const PortfolioReport& report);

} // namespace io
} // namespace repaircast

#endif // REPAIRCAST_IO_TEXT_REPORT_HPP

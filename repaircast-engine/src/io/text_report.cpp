#include "text_report.hpp"
#include <iomanip>
#include <sstream>
#include <string>

namespace repaircast {
namespace io {

namespace {

const std::string RULE(80, '=');
const std::string THIN_RULE(80, '-');

} // anonymous namespace

void write_cost_table(std::ostream& os, const CostProfile& profile) {
    std::ostringstream out;
    out << RULE << "\n";
    out << "15-YEAR COST PROJECTION: " << profile.label
        << " (severity " << profile.severity << "/5, " << profile.category << ")\n";
    out << RULE << "\n";

    out << std::left
        << std::setw(6) << "Year"
        << std::setw(34) << "Scheduled Work"
        << std::setw(14) << "Cost"
        << "Cumulative\n";
    out << THIN_RULE << "\n";

    out << std::fixed << std::setprecision(0);
    double cumulative = 0.0;
    for (const auto& row : profile.yearly_series) {
        cumulative += row.cost;
        out << std::left
            << std::setw(6) << row.year
            << std::setw(34) << row.scheduled_work
            << std::setw(14) << row.cost
            << cumulative << "\n";
    }

    out << THIN_RULE << "\n";
    for (const auto& h : profile.horizons) {
        out << h.year << "-year total: " << h.total << "\n";
    }
    out << "Summary: " << profile.summary << "\n";
    out << RULE << "\n\n";

    os << out.str();
}

void write_portfolio_summary(std::ostream& os, const PortfolioReport& report) {
    std::ostringstream out;
    out << RULE << "\n";
    out << "PORTFOLIO: " << report.photo_count << " photo(s), "
        << report.profile_count << " cost profile(s)\n";
    out << RULE << "\n";

    out << std::fixed << std::setprecision(0);
    for (const auto& t : report.totals) {
        out << std::left << std::setw(20) << (std::to_string(t.year) + "-year total:")
            << t.total << "\n";
    }

    if (!report.top_systems.empty()) {
        out << "\nTop cost drivers:\n";
        size_t rank = 1;
        for (const auto& system : report.top_systems) {
            out << "  " << rank++ << ". " << std::left << std::setw(40) << system.label
               << system.value << "\n";
        }
    }
    out << RULE << "\n";

    os << out.str();
}

} // namespace io
} // namespace repaircast

#include "json_writer.hpp"
#include "../horizon.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace repaircast {
namespace io {

namespace {

json points_to_json(const std::vector<HorizonTotal>& points) {
    json arr = json::array();
    for (const auto& p : points) {
        arr.push_back({{"year", p.year}, {"total", p.total}});
    }
    return arr;
}

json systems_to_json(const std::vector<SystemCost>& systems) {
    json arr = json::array();
    for (const auto& s : systems) {
        arr.push_back({{"label", s.label}, {"value", s.value}});
    }
    return arr;
}

} // anonymous namespace

json profile_to_json(const CostProfile& profile) {
    json rows = json::array();
    for (const auto& row : profile.yearly_series) {
        rows.push_back({
            {"year", row.year},
            {"cost", row.cost},
            {"scheduled_work", row.scheduled_work}
        });
    }

    return {
        {"label", profile.label},
        {"severity", profile.severity},
        {"category", profile.category},
        {"summary", profile.summary},
        {"authoritative", profile.authoritative},
        {"synthetic_item", profile.synthetic_item},
        {"yearly_series", rows},
        {"cumulative_series", points_to_json(cumulative_series(profile.yearly_series))},
        {"horizons", points_to_json(profile.horizons)},
        {"max_horizon", profile.max_horizon},
        {"max_yearly", profile.max_yearly}
    };
}

json portfolio_to_json(const PortfolioReport& report) {
    return {
        {"photo_count", report.photo_count},
        {"profile_count", report.profile_count},
        {"totals", points_to_json(report.totals)},
        {"top_systems", systems_to_json(report.top_systems)},
        {"yearly", points_to_json(report.yearly)},
        {"cumulative", points_to_json(report.cumulative)}
    };
}

json horizon_drill_down_to_json(const HorizonDrillDown& drill) {
    json years = json::array();
    for (const auto& y : drill.years) {
        years.push_back({
            {"year", y.year},
            {"total", y.total},
            {"by_system", systems_to_json(y.by_system)}
        });
    }

    json distribution = json::array();
    for (const auto& d : drill.distribution) {
        distribution.push_back({{"label", d.label}, {"value", d.value}, {"share", d.share}});
    }

    return {
        {"horizon_year", drill.horizon_year},
        {"years", years},
        {"distribution", distribution},
        {"grand_total", drill.grand_total}
    };
}

json system_drill_down_to_json(const SystemDrillDown& drill) {
    json instances = json::array();
    for (const auto& inst : drill.instances) {
        instances.push_back({
            {"photo_id", inst.photo_id},
            {"file_name", inst.file_name},
            {"severity", inst.severity},
            {"category", inst.category},
            {"total_cost", inst.total_cost}
        });
    }

    json years = json::array();
    for (const auto& y : drill.years) {
        json contributions = json::array();
        for (const auto& c : y.contributions) {
            contributions.push_back({
                {"photo_id", c.photo_id},
                {"file_name", c.file_name},
                {"cost", c.cost},
                {"scheduled_work", c.scheduled_work}
            });
        }
        years.push_back({{"year", y.year}, {"total", y.total}, {"contributions", contributions}});
    }

    return {
        {"label", drill.label},
        {"instances", instances},
        {"years", years},
        {"total_cost", drill.total_cost},
        {"average_severity", drill.average_severity}
    };
}

json session_report_to_json(const SessionReport& report) {
    json photos = json::array();
    for (const auto& photo : report.photos) {
        json profiles = json::array();
        for (const auto& profile : photo.cost_profiles) {
            profiles.push_back(profile_to_json(profile));
        }
        photos.push_back({
            {"id", photo.id},
            {"file_name", photo.file_name},
            {"cost_profiles", profiles}
        });
    }

    json j;
    j["portfolio"] = report.portfolio ? portfolio_to_json(*report.portfolio) : json(nullptr);
    j["photos"] = photos;
    if (report.horizon_drill_down) {
        j["horizon_drill_down"] = horizon_drill_down_to_json(*report.horizon_drill_down);
    }
    if (report.system_drill_down) {
        j["system_drill_down"] = system_drill_down_to_json(*report.system_drill_down);
    }
    return j;
}

void write_session_report_json(std::ostream& os, const SessionReport& report,
                               bool pretty_print) {
    json j = session_report_to_json(report);
    os << (pretty_print ? j.dump(2) : j.dump()) << "\n";
}

void write_session_report_json(const std::string& filepath, const SessionReport& report,
                               bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_session_report_json(file, report, pretty_print);
}

} // namespace io
} // namespace repaircast

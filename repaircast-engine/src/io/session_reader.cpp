#include "session_reader.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>

using json = nlohmann::json;

namespace repaircast {
namespace io {

namespace {

const json* find_member(const json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) {
        return nullptr;
    }
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string read_string(const json& obj, std::initializer_list<const char*> keys) {
    const json* value = find_member(obj, keys);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string();
}

std::optional<std::string> read_optional_string(const json& obj, std::initializer_list<const char*> keys) {
    const json* value = find_member(obj, keys);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return std::nullopt;
}

// Numbers are truncated toward zero, strings parsed for a leading integer.
// Absent or non-numeric values become DEFAULT_SEVERITY.
int read_severity(const json* value, const LogContext& ctx, const std::string& field) {
    if (!value) {
        return DEFAULT_SEVERITY;
    }
    if (value->is_number_integer()) {
        return clamp_severity(value->get<long long>());
    }
    if (value->is_number()) {
        double d = value->get<double>();
        if (std::isfinite(d)) {
            return clamp_severity(static_cast<long long>(std::trunc(std::max(-1e6, std::min(1e6, d)))));
        }
    } else if (value->is_string()) {
        return parse_severity(value->get<std::string>());
    }
    Logger::get_instance().log_input_warning(ctx, field, "non-numeric severity, using default 3");
    return DEFAULT_SEVERITY;
}

// Non-numeric or negative numbers read as 0
double read_number(const json* value) {
    if (!value) {
        return 0.0;
    }
    if (value->is_number()) {
        double d = value->get<double>();
        return std::isfinite(d) ? d : 0.0;
    }
    if (value->is_string()) {
        try {
            double d = std::stod(value->get<std::string>());
            return std::isfinite(d) ? d : 0.0;
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

int read_year(const json* value) {
    double d = read_number(value);
    if (d < 0.0 || d > 1000.0) {
        return 0;
    }
    return static_cast<int>(d);
}

YearlyCostRow parse_yearly_row(const json& row, const LogContext& ctx, const std::string& field) {
    int year = read_year(find_member(row, {"year"}));
    double cost = read_number(find_member(row, {"cost"}));
    if (cost < 0.0) {
        Logger::get_instance().log_input_warning(ctx, field + ".cost", "negative cost, using 0");
        cost = 0.0;
    }

    std::string work = read_string(row, {"scheduled_work", "notes"});
    if (work.empty()) {
        work = cost > 0.0 ? "Scheduled work" : NO_WORK_SCHEDULED;
    }
    return YearlyCostRow(year, cost, std::move(work));
}

RepairSchedule parse_repair_schedule(const json& obj) {
    RepairSchedule schedule;
    schedule.next_repair_year = read_year(find_member(obj, {"next_repair_year"}));
    std::string type = read_string(obj, {"repair_type"});
    if (!type.empty()) {
        schedule.repair_type = type;
    }
    schedule.estimated_cost = read_number(find_member(obj, {"estimated_cost"}));

    const json* maintenance = find_member(obj, {"additional_maintenance"});
    if (maintenance && maintenance->is_array()) {
        for (const auto& event : *maintenance) {
            MaintenanceEvent maint;
            maint.year = read_year(find_member(event, {"year"}));
            std::string event_type = read_string(event, {"type"});
            if (!event_type.empty()) {
                maint.type = event_type;
            }
            maint.cost = read_number(find_member(event, {"cost"}));
            schedule.additional_maintenance.push_back(std::move(maint));
        }
    }
    return schedule;
}

AuthoritativeAnalysis parse_analysis(
    const json& obj,
    const ScheduleProjectionParams& schedule_params,
    const LogContext& ctx,
    const std::string& field)
{
    AuthoritativeAnalysis analysis;
    analysis.damage_item = read_string(obj, {"damage_item", "item"});

    const json* severity = find_member(obj, {"severity"});
    if (severity) {
        analysis.severity = read_severity(severity, ctx, field + ".severity");
    }

    const json* complete = find_member(obj, {"complete_data"});
    if (complete) {
        analysis.category = read_optional_string(*complete, {"Category", "category"});
    }
    if (!analysis.category) {
        analysis.category = read_optional_string(obj, {"category"});
    }

    const json* projection = find_member(obj, {"ten_year_projection", "projection"});
    if (projection) {
        const json* rows = find_member(*projection, {"yearly_costs"});
        if (rows && rows->is_array()) {
            size_t i = 0;
            for (const auto& row : *rows) {
                analysis.yearly_costs.push_back(
                    parse_yearly_row(row, ctx, field + ".yearly_costs[" + std::to_string(i++) + "]"));
            }
        }
        analysis.summary = read_optional_string(*projection, {"summary"});
    }

    const json* schedule = find_member(obj, {"repair_schedule"});
    if (schedule && schedule->is_object()) {
        analysis.repair_schedule = parse_repair_schedule(*schedule);
        if (analysis.yearly_costs.empty()) {
            ScheduleProjection derived = project_repair_schedule(*analysis.repair_schedule, schedule_params);
            analysis.yearly_costs = std::move(derived.yearly_costs);
            if (!analysis.summary) {
                analysis.summary = derived.summary;
            }
        }
    }

    return analysis;
}

PhotoInput parse_photo(const json& obj, size_t index, const ScheduleProjectionParams& schedule_params) {
    PhotoInput photo;
    photo.id = read_string(obj, {"id", "imageID"});
    photo.file_name = read_string(obj, {"file_name", "fileName"});
    if (photo.id.empty()) {
        photo.id = photo.file_name.empty() ? "photo-" + std::to_string(index + 1) : photo.file_name;
    }
    if (photo.file_name.empty()) {
        photo.file_name = photo.id;
    }

    LogContext ctx(photo.id, "load");
    Logger& logger = Logger::get_instance();

    const json* detections = find_member(obj, {"detections", "annotation", "annotations"});
    if (detections && detections->is_array()) {
        size_t i = 0;
        for (const auto& det : *detections) {
            std::string field = "detections[" + std::to_string(i++) + "]";
            if (!det.is_object()) {
                logger.log_input_warning(ctx, field, "detection is not an object, skipped");
                continue;
            }
            DamageItem item;
            item.label = read_string(det, {"label", "damage_item"});
            item.severity = read_severity(find_member(det, {"severity"}), ctx, field + ".severity");
            photo.detections.push_back(std::move(item));
        }
    } else if (detections) {
        logger.log_input_warning(ctx, "detections", "not an array, treated as empty");
    }

    const json* analyses = find_member(obj, {"analyses"});
    if (!analyses) {
        const json* result = find_member(obj, {"result"});
        if (result) {
            analyses = find_member(*result, {"analyses"});
        }
    }
    if (analyses && analyses->is_array()) {
        size_t i = 0;
        for (const auto& entry : *analyses) {
            std::string field = "analyses[" + std::to_string(i++) + "]";
            if (!entry.is_object()) {
                logger.log_input_warning(ctx, field, "analysis is not an object, skipped");
                continue;
            }
            photo.analyses.push_back(parse_analysis(entry, schedule_params, ctx, field));
        }
    }

    return photo;
}

} // anonymous namespace

std::vector<PhotoInput> read_session_from_string(
    const std::string& json_string,
    const ScheduleProjectionParams& schedule)
{
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::exception& e) {
        throw InputParseError("Failed to parse session JSON: " + std::string(e.what()));
    }

    const json* photos = nullptr;
    json single = json::array();
    if (j.is_array()) {
        photos = &j;
    } else if (j.is_object()) {
        photos = find_member(j, {"photos"});
        if (!photos) {
            single.push_back(j);
            photos = &single;
        } else if (!photos->is_array()) {
            throw InputParseError("Session field 'photos' must be an array");
        }
    } else {
        throw InputParseError("Session snapshot must be a JSON object or array");
    }

    std::vector<PhotoInput> inputs;
    inputs.reserve(photos->size());
    size_t index = 0;
    for (const auto& photo : *photos) {
        if (!photo.is_object()) {
            Logger::get_instance().log_input_warning(
                LogContext("", "load"), "photos[" + std::to_string(index) + "]",
                "photo is not an object, skipped");
            ++index;
            continue;
        }
        inputs.push_back(parse_photo(photo, index, schedule));
        ++index;
    }
    return inputs;
}

std::vector<PhotoInput> read_session_from_file(
    const std::string& filepath,
    const ScheduleProjectionParams& schedule)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw InputParseError("Cannot open session file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_session_from_string(buffer.str(), schedule);
}

} // namespace io
} // namespace repaircast

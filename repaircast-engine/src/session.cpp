#include "session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>

namespace repaircast {

ProcessedPhoto process_photo(const PhotoInput& input, const EngineConfig& config) {
    Logger& logger = Logger::get_instance();
    LogContext ctx(input.id, "process");

    ProcessedPhoto photo;
    photo.id = input.id;
    photo.file_name = input.file_name;
    photo.cost_profiles = build_photo_profiles(
        input.file_name, input.detections, input.analyses, config.fallback);

    size_t matched = 0;
    size_t synthetic = 0;
    for (const auto& profile : photo.cost_profiles) {
        if (profile.authoritative) ++matched;
        if (profile.synthetic_item) ++synthetic;

        logger.log_debug(ctx, "Profile built", {
            {"label", profile.label},
            {"severity", std::to_string(profile.severity)},
            {"category", profile.category},
            {"total_15_year", std::to_string(profile.horizon_total(HORIZON_YEARS.back()))}
        });
    }

    if (synthetic > 0) {
        size_t usable = static_cast<size_t>(std::count_if(
            input.detections.begin(), input.detections.end(), is_usable_detection));
        logger.log_fallback_items(ctx, usable, synthetic);
    }

    logger.log_photo_processed(ctx, photo.cost_profiles.size(), matched, synthetic);
    return photo;
}

std::vector<ProcessedPhoto> process_session(
    const std::vector<PhotoInput>& inputs,
    const EngineConfig& config)
{
    std::vector<ProcessedPhoto> photos;
    photos.reserve(inputs.size());
    for (const auto& input : inputs) {
        photos.push_back(process_photo(input, config));
    }
    return photos;
}

SessionReport build_session_report(
    const std::vector<PhotoInput>& inputs,
    const EngineConfig& config,
    std::optional<int> horizon_year,
    std::optional<std::string> system_label)
{
    auto start = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    SessionReport report;
    report.photos = process_session(inputs, config);
    report.portfolio = build_portfolio_report(report.photos, config.top_systems);

    if (horizon_year) {
        report.horizon_drill_down = drill_down_horizon(report.photos, *horizon_year);
        if (!report.horizon_drill_down) {
            logger.log_warning(LogContext("", "report"),
                "Nothing to show for horizon " + std::to_string(*horizon_year));
        }
    }

    if (system_label) {
        report.system_drill_down = drill_down_system(report.photos, *system_label);
        if (!report.system_drill_down) {
            logger.log_warning(LogContext("", "report"),
                "No profile labeled '" + *system_label + "'");
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (report.portfolio) {
        logger.log_report_complete(
            report.portfolio->photo_count,
            report.portfolio->profile_count,
            report.portfolio->total_at(HORIZON_YEARS.back()),
            elapsed_ms);
    } else {
        logger.log_warning(LogContext("", "report"), "No processed photos; portfolio is empty");
    }

    return report;
}

} // namespace repaircast

#ifndef REPAIRCAST_IO_SESSION_READER_HPP
#define REPAIRCAST_IO_SESSION_READER_HPP

#include "../schedule.hpp"
#include "../session.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace repaircast {

/**
 * @brief Exception thrown when a session snapshot cannot be read at all
 *
 * Individual malformed fields never raise; they are defaulted and logged.
 */
class InputParseError : public std::runtime_error {
public:
    explicit InputParseError(const std::string& message)
        : std::runtime_error(message) {}
};

namespace io {

// Parse a session snapshot.
//
// Accepted shapes:
//   { "photos": [ photo, ... ] }
//   [ photo, ... ]
//   photo                       (a single photo object)
//
// photo:
//   { "id" | "imageID", "file_name" | "fileName",
//     "detections" | "annotation" | "annotations": [ { "label", "severity" } ],
//     "analyses" | "result": { "analyses" }: [ analysis ] }
//
// analysis:
//   { "damage_item", "severity", "complete_data": { "Category" },
//     "ten_year_projection": { "yearly_costs": [ { "year", "cost",
//                                                  "scheduled_work" | "notes" } ],
//                              "summary" },
//     "repair_schedule": { "next_repair_year", "repair_type", "estimated_cost",
//                          "additional_maintenance": [ { "year", "type", "cost" } ] } }
//
// An analysis with a repair schedule but no yearly rows gets its rows (and,
// if missing, its summary) from project_repair_schedule.
//
// @throws InputParseError if the text is not JSON or has no usable shape
std::vector<PhotoInput> read_session_from_string(
    const std::string& json_string,
    const ScheduleProjectionParams& schedule = ScheduleProjectionParams()
);

// @throws InputParseError if the file cannot be opened or parsed
std::vector<PhotoInput> read_session_from_file(
    const std::string& filepath,
    const ScheduleProjectionParams& schedule = ScheduleProjectionParams()
);

} // namespace io
} // namespace repaircast

#endif // REPAIRCAST_IO_SESSION_READER_HPP

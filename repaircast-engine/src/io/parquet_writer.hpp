#ifndef REPAIRCAST_PARQUET_WRITER_HPP
#define REPAIRCAST_PARQUET_WRITER_HPP

#include "../profile.hpp"
#include <string>
#include <vector>

namespace repaircast {

class ParquetWriter {
public:
    /**
     * Write every yearly row of every profile to a Parquet file.
     *
     * Output schema (one row per photo × profile × year):
     *   - photo_id: utf8
     *   - file_name: utf8
     *   - label: utf8
     *   - category: utf8
     *   - severity: int32
     *   - year: int32 (1-15)
     *   - cost: float64
     *   - scheduled_work: utf8
     *
     * @param photos Processed photos
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow is unavailable
     */
    static void write_profiles(const std::vector<ProcessedPhoto>& photos, const std::string& filepath);

    // True when built with Apache Arrow
    static bool available();
};

} // namespace repaircast

#endif // REPAIRCAST_PARQUET_WRITER_HPP

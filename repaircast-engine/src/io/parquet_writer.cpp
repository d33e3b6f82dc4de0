#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace repaircast {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_profiles(const std::vector<ProcessedPhoto>& photos, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("photo_id", arrow::utf8()),
        arrow::field("file_name", arrow::utf8()),
        arrow::field("label", arrow::utf8()),
        arrow::field("category", arrow::utf8()),
        arrow::field("severity", arrow::int32()),
        arrow::field("year", arrow::int32()),
        arrow::field("cost", arrow::float64()),
        arrow::field("scheduled_work", arrow::utf8())
    });

    arrow::StringBuilder photo_id_builder;
    arrow::StringBuilder file_name_builder;
    arrow::StringBuilder label_builder;
    arrow::StringBuilder category_builder;
    arrow::Int32Builder severity_builder;
    arrow::Int32Builder year_builder;
    arrow::DoubleBuilder cost_builder;
    arrow::StringBuilder work_builder;

    for (const auto& photo : photos) {
        for (const auto& profile : photo.cost_profiles) {
            for (const auto& row : profile.yearly_series) {
                check(photo_id_builder.Append(photo.id), "append photo_id");
                check(file_name_builder.Append(photo.file_name), "append file_name");
                check(label_builder.Append(profile.label), "append label");
                check(category_builder.Append(profile.category), "append category");
                check(severity_builder.Append(profile.severity), "append severity");
                check(year_builder.Append(row.year), "append year");
                check(cost_builder.Append(row.cost), "append cost");
                check(work_builder.Append(row.scheduled_work), "append scheduled_work");
            }
        }
    }

    std::shared_ptr<arrow::Array> photo_id_array, file_name_array, label_array, category_array;
    std::shared_ptr<arrow::Array> severity_array, year_array, cost_array, work_array;
    check(photo_id_builder.Finish(&photo_id_array), "finish photo_id array");
    check(file_name_builder.Finish(&file_name_array), "finish file_name array");
    check(label_builder.Finish(&label_array), "finish label array");
    check(category_builder.Finish(&category_array), "finish category array");
    check(severity_builder.Finish(&severity_array), "finish severity array");
    check(year_builder.Finish(&year_array), "finish year array");
    check(cost_builder.Finish(&cost_array), "finish cost array");
    check(work_builder.Finish(&work_array), "finish scheduled_work array");

    auto table = arrow::Table::Make(schema, {
        photo_id_array, file_name_array, label_array, category_array,
        severity_array, year_array, cost_array, work_array
    });

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 64 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_profiles(const std::vector<ProcessedPhoto>& /* photos */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace repaircast

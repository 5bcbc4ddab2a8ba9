#include "parquet_writer.hpp"
#include "output_file.hpp"
#include <cstdint>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace poolrisk {
namespace io {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

void write_table(const std::vector<double>& returns, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("simulation_id", arrow::uint32()),
        arrow::field("return", arrow::float64())
    });

    arrow::UInt32Builder id_builder;
    arrow::DoubleBuilder return_builder;

    check(id_builder.Reserve(static_cast<int64_t>(returns.size())),
          "Failed to reserve memory for simulation_id column");
    check(return_builder.Reserve(static_cast<int64_t>(returns.size())),
          "Failed to reserve memory for return column");

    for (size_t i = 0; i < returns.size(); ++i) {
        check(id_builder.Append(static_cast<uint32_t>(i)), "Failed to append simulation_id");
        check(return_builder.Append(returns[i]), "Failed to append return");
    }

    std::shared_ptr<arrow::Array> id_array;
    check(id_builder.Finish(&id_array), "Failed to finish simulation_id array");
    std::shared_ptr<arrow::Array> return_array;
    check(return_builder.Finish(&return_array), "Failed to finish return array");

    auto table = arrow::Table::Make(schema, {id_array, return_array});

    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath +
                                 " - " + opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

} // anonymous namespace

void ParquetWriter::stage_returns(OutputBatch& outputs, const std::vector<double>& returns,
                                  const std::string& filepath) {
    if (returns.empty()) {
        throw std::runtime_error("No simulated returns to write to " + filepath);
    }
    if (returns.size() > UINT32_MAX) {
        throw std::runtime_error("Too many simulations for a uint32 simulation_id column");
    }

    outputs.add_file(filepath, [&](const std::string& temporary) {
        write_table(returns, temporary);
    });
}

bool ParquetWriter::available() {
    return true;
}

#else // !HAVE_ARROW

void ParquetWriter::stage_returns(OutputBatch& /* outputs */, const std::vector<double>& /* returns */,
                                  const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow/Parquet installed to enable Parquet output.");
}

bool ParquetWriter::available() {
    return false;
}

#endif // HAVE_ARROW

void ParquetWriter::write_returns(const std::vector<double>& returns, const std::string& filepath) {
    OutputBatch outputs;
    stage_returns(outputs, returns, filepath);
    outputs.commit();
}

} // namespace io
} // namespace poolrisk

#ifndef POOLRISK_IO_PARQUET_WRITER_HPP
#define POOLRISK_IO_PARQUET_WRITER_HPP

#include "output_file.hpp"
#include <string>
#include <vector>

namespace poolrisk {
namespace io {

class ParquetWriter {
public:
    /**
     * Write the portfolio return distribution to a Parquet file.
     *
     * Output schema:
     *   - simulation_id: uint32 (0-indexed)
     *   - return: float64 (weighted portfolio return of the simulation)
     *
     * The file is written to a temporary sibling and renamed into place.
     *
     * @param returns Portfolio return per simulation
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the returns are empty, the file cannot
     *         be written, or the build has no Arrow support
     */
    static void write_returns(const std::vector<double>& returns, const std::string& filepath);

    // Same checks and schema, but the file joins `outputs` and is published
    // by its commit()
    static void stage_returns(OutputBatch& outputs, const std::vector<double>& returns,
                              const std::string& filepath);

    // Whether this build can write Parquet at all
    static bool available();
};

} // namespace io
} // namespace poolrisk

#endif // POOLRISK_IO_PARQUET_WRITER_HPP

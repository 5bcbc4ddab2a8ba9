#ifndef POOLRISK_IO_JSON_WRITER_HPP
#define POOLRISK_IO_JSON_WRITER_HPP

#include "../evaluation.hpp"
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace poolrisk {
namespace io {

// Run context that is not part of the evaluation result itself
struct SummaryMetadata {
    std::string probabilities_source;
    std::string portfolio_source;
    std::string pay_table;                  // PayTable::describe()
    std::vector<std::string> warnings;      // recovered conditions
};

// Build the summary document: run parameters, risk measures, distribution
// summary, per-ticket statistics, timings and warnings. The per-simulation
// returns go to the returns CSV or Parquet file instead.
nlohmann::json summary_to_json(const RiskEvaluation& result, const SummaryMetadata& metadata);

void write_summary_json(std::ostream& os, const RiskEvaluation& result,
                        const SummaryMetadata& metadata, bool pretty_print = true);

void write_summary_json(const std::string& filepath, const RiskEvaluation& result,
                        const SummaryMetadata& metadata, bool pretty_print = true);

} // namespace io
} // namespace poolrisk

#endif // POOLRISK_IO_JSON_WRITER_HPP

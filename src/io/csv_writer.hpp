#ifndef POOLRISK_IO_CSV_WRITER_HPP
#define POOLRISK_IO_CSV_WRITER_HPP

#include "../risk_metrics.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace poolrisk {
namespace io {

// Single `return` column, one row per simulation, full double precision
void write_returns_csv(std::ostream& os, const std::vector<double>& returns);
void write_returns_csv(const std::string& filepath, const std::vector<double>& returns);

// `metric,value` rows: VaR{alpha} then ES{alpha}
void write_risk_csv(std::ostream& os, const RiskMeasures& risk);
void write_risk_csv(const std::string& filepath, const RiskMeasures& risk);

} // namespace io
} // namespace poolrisk

#endif // POOLRISK_IO_CSV_WRITER_HPP

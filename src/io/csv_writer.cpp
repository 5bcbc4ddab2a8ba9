#include "csv_writer.hpp"
#include "output_file.hpp"
#include <iomanip>
#include <limits>

namespace poolrisk {
namespace io {

void write_returns_csv(std::ostream& os, const std::vector<double>& returns) {
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "return\n";
    for (double r : returns) {
        os << r << '\n';
    }
}

void write_returns_csv(const std::string& filepath, const std::vector<double>& returns) {
    write_file_atomically(filepath, [&](std::ostream& os) { write_returns_csv(os, returns); });
}

void write_risk_csv(std::ostream& os, const RiskMeasures& risk) {
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "metric,value\n";
    os << risk.var_label() << ',' << risk.value_at_risk << '\n';
    os << risk.es_label() << ',' << risk.expected_shortfall << '\n';
}

void write_risk_csv(const std::string& filepath, const RiskMeasures& risk) {
    write_file_atomically(filepath, [&](std::ostream& os) { write_risk_csv(os, risk); });
}

} // namespace io
} // namespace poolrisk

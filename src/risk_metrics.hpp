#ifndef POOLRISK_RISK_METRICS_HPP
#define POOLRISK_RISK_METRICS_HPP

#include <string>
#include <vector>

namespace poolrisk {

// Tail-risk measures of a return distribution, expressed as losses (L = -return)
struct RiskMeasures {
    double alpha;
    double value_at_risk;       // alpha-quantile of losses
    double expected_shortfall;  // mean loss at or beyond the VaR

    RiskMeasures();

    std::string var_label() const;  // e.g. "VaR95"
    std::string es_label() const;   // e.g. "ES95"
};

// Descriptive statistics of the portfolio return distribution
struct DistributionSummary {
    size_t count;
    double mean;
    double std_dev;             // population standard deviation
    double min;
    double max;
    double p05;
    double p50;
    double p95;
    double prob_positive;       // share of simulations with return > 0

    DistributionSummary();
};

// Quantile with linear interpolation between order statistics at position
// q * (n - 1). sorted_values must be ascending and non-empty; q in [0, 1].
double quantile_sorted(const std::vector<double>& sorted_values, double q);

// Same, sorting a copy first. Throws InsufficientData when values is empty.
double quantile(std::vector<double> values, double q);

// VaR and ES at confidence alpha in (0, 1).
// Throws InsufficientData for an empty distribution and std::invalid_argument
// for alpha outside (0, 1).
RiskMeasures var_es(const std::vector<double>& returns, double alpha);

// Throws InsufficientData for an empty distribution
DistributionSummary summarize(const std::vector<double>& returns);

// 0.95 -> "95", 0.975 -> "97.5"
std::string alpha_label(double alpha);

} // namespace poolrisk

#endif // POOLRISK_RISK_METRICS_HPP

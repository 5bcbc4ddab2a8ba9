#include "risk_metrics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace poolrisk {

RiskMeasures::RiskMeasures()
    : alpha(0.0), value_at_risk(0.0), expected_shortfall(0.0) {}

std::string RiskMeasures::var_label() const {
    return "VaR" + alpha_label(alpha);
}

std::string RiskMeasures::es_label() const {
    return "ES" + alpha_label(alpha);
}

DistributionSummary::DistributionSummary()
    : count(0), mean(0.0), std_dev(0.0), min(0.0), max(0.0),
      p05(0.0), p50(0.0), p95(0.0), prob_positive(0.0) {}

// ============================================================================
// Quantiles
// ============================================================================

double quantile_sorted(const std::vector<double>& sorted_values, double q) {
    if (sorted_values.empty()) {
        throw InsufficientData("Cannot take a quantile of an empty distribution");
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = q * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[std::min(lower_idx, sorted_values.size() - 1)];
    }

    const double lo = sorted_values[lower_idx];
    const double hi = sorted_values[upper_idx];
    if (lo == hi) {
        return lo;
    }

    // Stays within [lo, hi] so a tail taken at the quantile keeps its ties
    double frac = pos - static_cast<double>(lower_idx);
    return std::min(std::max(lo + (hi - lo) * frac, lo), hi);
}

double quantile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    return quantile_sorted(values, q);
}

// ============================================================================
// Value-at-Risk / Expected Shortfall
// ============================================================================

RiskMeasures var_es(const std::vector<double>& returns, double alpha) {
    if (returns.empty()) {
        throw InsufficientData("Cannot compute VaR/ES: return distribution is empty");
    }
    if (!(alpha > 0.0 && alpha < 1.0)) {
        throw std::invalid_argument("Confidence level alpha must be in (0, 1)");
    }

    std::vector<double> losses;
    losses.reserve(returns.size());
    for (double r : returns) {
        losses.push_back(-r);
    }
    std::sort(losses.begin(), losses.end());

    RiskMeasures measures;
    measures.alpha = alpha;
    measures.value_at_risk = quantile_sorted(losses, alpha);

    // Losses are ascending, so the tail is a suffix
    auto tail_begin = std::lower_bound(losses.begin(), losses.end(), measures.value_at_risk);
    if (tail_begin == losses.end()) {
        measures.expected_shortfall = measures.value_at_risk;
    } else {
        double sum = std::accumulate(tail_begin, losses.end(), 0.0);
        measures.expected_shortfall = sum / static_cast<double>(losses.end() - tail_begin);
    }
    return measures;
}

// ============================================================================
// Distribution summary
// ============================================================================

DistributionSummary summarize(const std::vector<double>& returns) {
    if (returns.empty()) {
        throw InsufficientData("Cannot summarize an empty return distribution");
    }

    DistributionSummary summary;
    summary.count = returns.size();

    const double n = static_cast<double>(returns.size());
    summary.mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;

    double sum_sq_diff = 0.0;
    size_t positive = 0;
    for (double r : returns) {
        double diff = r - summary.mean;
        sum_sq_diff += diff * diff;
        positive += r > 0.0 ? 1 : 0;
    }
    summary.std_dev = returns.size() < 2 ? 0.0 : std::sqrt(sum_sq_diff / n);
    summary.prob_positive = static_cast<double>(positive) / n;

    std::vector<double> sorted = returns;
    std::sort(sorted.begin(), sorted.end());
    summary.min = sorted.front();
    summary.max = sorted.back();
    summary.p05 = quantile_sorted(sorted, 0.05);
    summary.p50 = quantile_sorted(sorted, 0.50);
    summary.p95 = quantile_sorted(sorted, 0.95);

    return summary;
}

std::string alpha_label(double alpha) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << alpha * 100.0;
    std::string label = oss.str();
    label.erase(label.find_last_not_of('0') + 1);
    if (!label.empty() && label.back() == '.') {
        label.pop_back();
    }
    return label;
}

} // namespace poolrisk

#ifndef POOLRISK_AGGREGATION_HPP
#define POOLRISK_AGGREGATION_HPP

#include "payout.hpp"
#include <vector>

namespace poolrisk {

// Portfolio return per simulation: returns[s] = sum_t weights[t] * payout(s, t).
// Weights are expected to be normalized already (see Portfolio).
// Throws ShapeMismatch if weights.size() != payouts.num_tickets().
std::vector<double> aggregate_returns(const PayoutMatrix& payouts,
                                      const std::vector<double>& weights);

} // namespace poolrisk

#endif // POOLRISK_AGGREGATION_HPP

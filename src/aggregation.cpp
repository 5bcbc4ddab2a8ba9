#include "aggregation.hpp"
#include "errors.hpp"
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace poolrisk {

std::vector<double> aggregate_returns(const PayoutMatrix& payouts,
                                      const std::vector<double>& weights) {
    const size_t num_tickets = payouts.num_tickets();
    if (weights.size() != num_tickets) {
        throw ShapeMismatch("Portfolio has " + std::to_string(weights.size()) +
                            " weights for " + std::to_string(num_tickets) + " tickets");
    }

    const size_t num_simulations = payouts.num_simulations();
    std::vector<double> returns(num_simulations, 0.0);

    // Summation order is fixed per simulation, so results do not depend on threading
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t s = 0; s < num_simulations; ++s) {
        const double* row = payouts.payout_row(s);
        double total = 0.0;
        for (size_t t = 0; t < num_tickets; ++t) {
            total += weights[t] * row[t];
        }
        returns[s] = total;
    }

    return returns;
}

} // namespace poolrisk

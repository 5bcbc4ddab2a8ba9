#ifndef POOLRISK_PAYOUT_HPP
#define POOLRISK_PAYOUT_HPP

#include "outcome.hpp"
#include "pay_table.hpp"
#include "portfolio.hpp"
#include "simulation.hpp"
#include "ticket.hpp"
#include <cstdint>
#include <vector>

namespace poolrisk {

// Matches whose simulated outcome lies in the ticket's coverage set.
// Throws TicketShapeMismatch if the ticket length differs from num_matches.
size_t count_hits(const Ticket& ticket, const Outcome* result, size_t num_matches);
size_t count_hits(const Ticket& ticket, const std::vector<Outcome>& result);

// Payout of one ticket for one simulated result of the round
double payout(const Ticket& ticket, const Outcome* result, size_t num_matches,
              const PayTable& pay_table);
double payout(const Ticket& ticket, const std::vector<Outcome>& result,
              const PayTable& pay_table);

// PayoutMatrix: S x T hit counts and payouts, simulation-major
class PayoutMatrix {
public:
    PayoutMatrix();
    PayoutMatrix(size_t num_simulations, size_t num_tickets);

    size_t num_simulations() const { return num_simulations_; }
    size_t num_tickets() const { return num_tickets_; }

    double payout(size_t simulation, size_t ticket) const {
        return payouts_[simulation * num_tickets_ + ticket];
    }
    size_t hits(size_t simulation, size_t ticket) const {
        return hits_[simulation * num_tickets_ + ticket];
    }

    void set(size_t simulation, size_t ticket, size_t hits, double payout);

    const double* payout_row(size_t simulation) const { return payouts_.data() + simulation * num_tickets_; }

    const std::vector<double>& payouts() const { return payouts_; }

private:
    size_t num_simulations_;
    size_t num_tickets_;
    std::vector<uint16_t> hits_;
    std::vector<double> payouts_;
};

// Score every ticket of the portfolio against every simulation of the batch.
// Throws TicketShapeMismatch if the batch and the tickets disagree on M.
PayoutMatrix score_batch(const Portfolio& portfolio, const SimulationBatch& batch);

} // namespace poolrisk

#endif // POOLRISK_PAYOUT_HPP

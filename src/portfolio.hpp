#ifndef POOLRISK_PORTFOLIO_HPP
#define POOLRISK_PORTFOLIO_HPP

#include "pay_table.hpp"
#include "ticket.hpp"
#include <istream>
#include <string>
#include <vector>

namespace poolrisk {

// Normalize stake weights to sum to 1. Falls back to uniform weights when the
// input sums to zero or contains a negative or non-finite value.
std::vector<double> normalize_weights(const std::vector<double>& weights);

// True when normalize_weights() would fall back to uniform weights
bool weights_fall_back_to_uniform(const std::vector<double>& weights);

// Portfolio: tickets, their normalized weights and the pay table, fixed at
// construction.
class Portfolio {
public:
    // Weights are taken from each ticket's stake_weight.
    // Throws SchemaError for an empty ticket list and ShapeMismatch when the
    // tickets do not all cover the same number of matches.
    explicit Portfolio(std::vector<Ticket> tickets, PayTable pay_table = PayTable());

    size_t num_tickets() const { return tickets_.size(); }
    size_t num_matches() const { return tickets_.front().size(); }

    const std::vector<Ticket>& tickets() const { return tickets_; }
    const Ticket& ticket(size_t index) const;
    const std::vector<double>& weights() const { return weights_; }
    const PayTable& pay_table() const { return pay_table_; }

    bool uniform_weight_fallback() const { return uniform_fallback_; }

private:
    std::vector<Ticket> tickets_;
    std::vector<double> weights_;
    PayTable pay_table_;
    bool uniform_fallback_;
};

// Tickets read from a portfolio-plan CSV, before the pay table is attached
struct PortfolioPlan {
    std::vector<Ticket> tickets;
    bool has_stake_weight_column;
    std::vector<std::string> warnings;  // recovered conditions, one per ticket

    PortfolioPlan();

    // Load a plan with columns J1..JM and optional stake_weight.
    // The pick columns must be exactly J1..J<num_matches>: a gap, a duplicate
    // or no pick column at all is a SchemaError; a different count is a
    // TicketShapeMismatch. A plan with no ticket rows is a SchemaError.
    static PortfolioPlan load_from_csv(const std::string& filepath, size_t num_matches);
    static PortfolioPlan load_from_csv(std::istream& is, size_t num_matches);
};

} // namespace poolrisk

#endif // POOLRISK_PORTFOLIO_HPP

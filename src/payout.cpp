#include "payout.hpp"
#include "errors.hpp"
#include <limits>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace poolrisk {

namespace {

inline size_t hits_unchecked(const Ticket& ticket, const Outcome* result, size_t num_matches) {
    size_t hits = 0;
    for (size_t m = 0; m < num_matches; ++m) {
        hits += ticket.coverage[m].contains(result[m]) ? 1 : 0;
    }
    return hits;
}

} // anonymous namespace

size_t count_hits(const Ticket& ticket, const Outcome* result, size_t num_matches) {
    if (ticket.size() != num_matches) {
        throw TicketShapeMismatch(ticket.size(), num_matches);
    }
    return hits_unchecked(ticket, result, num_matches);
}

size_t count_hits(const Ticket& ticket, const std::vector<Outcome>& result) {
    return count_hits(ticket, result.data(), result.size());
}

double payout(const Ticket& ticket, const Outcome* result, size_t num_matches,
              const PayTable& pay_table) {
    return pay_table.payout(count_hits(ticket, result, num_matches), num_matches);
}

double payout(const Ticket& ticket, const std::vector<Outcome>& result,
              const PayTable& pay_table) {
    return payout(ticket, result.data(), result.size(), pay_table);
}

// ============================================================================
// PayoutMatrix Implementation
// ============================================================================

PayoutMatrix::PayoutMatrix() : num_simulations_(0), num_tickets_(0) {}

PayoutMatrix::PayoutMatrix(size_t num_simulations, size_t num_tickets)
    : num_simulations_(num_simulations),
      num_tickets_(num_tickets),
      hits_(num_simulations * num_tickets, 0),
      payouts_(num_simulations * num_tickets, 0.0) {}

void PayoutMatrix::set(size_t simulation, size_t ticket, size_t hits, double payout) {
    const size_t idx = simulation * num_tickets_ + ticket;
    hits_[idx] = static_cast<uint16_t>(hits);
    payouts_[idx] = payout;
}

PayoutMatrix score_batch(const Portfolio& portfolio, const SimulationBatch& batch) {
    const size_t num_matches = batch.num_matches();
    const size_t num_tickets = portfolio.num_tickets();
    const size_t num_simulations = batch.num_simulations();

    for (const auto& ticket : portfolio.tickets()) {
        if (ticket.size() != num_matches) {
            throw TicketShapeMismatch(ticket.size(), num_matches);
        }
    }
    if (num_matches > std::numeric_limits<uint16_t>::max()) {
        throw ShapeMismatch("Round has too many matches: " + std::to_string(num_matches));
    }

    // Payout by hit count, looked up once instead of per simulation
    const PayTable& pay_table = portfolio.pay_table();
    std::vector<double> payout_by_hits(num_matches + 1);
    for (size_t h = 0; h <= num_matches; ++h) {
        payout_by_hits[h] = pay_table.payout(h, num_matches);
    }

    PayoutMatrix matrix(num_simulations, num_tickets);
    const auto& tickets = portfolio.tickets();

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t s = 0; s < num_simulations; ++s) {
        const Outcome* result = batch.row(s);
        for (size_t t = 0; t < num_tickets; ++t) {
            const size_t hits = hits_unchecked(tickets[t], result, num_matches);
            matrix.set(s, t, hits, payout_by_hits[hits]);
        }
    }

    return matrix;
}

} // namespace poolrisk

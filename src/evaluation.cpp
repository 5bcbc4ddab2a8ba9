#include "evaluation.hpp"
#include "aggregation.hpp"
#include "errors.hpp"
#include "payout.hpp"
#include "simulation.hpp"
#include <chrono>
#include <utility>

namespace poolrisk {

// ============================================================================
// Result / config defaults
// ============================================================================

TicketStatistics::TicketStatistics()
    : index(0), singles(0), doubles(0), triples(0), weight(0.0),
      full_hit_probability(0.0), simulated_full_hit_rate(0.0),
      near_miss_rate(0.0), expected_payout(0.0) {}

RiskEvaluation::RiskEvaluation()
    : num_simulations(0), num_matches(0), seed(0),
      simulate_time_ms(0.0), score_time_ms(0.0), aggregate_time_ms(0.0),
      metrics_time_ms(0.0), execution_time_ms(0.0) {}

EvaluationConfig::EvaluationConfig()
    : num_simulations(DEFAULT_SIMULATIONS),
      alpha(DEFAULT_ALPHA),
      seed(DEFAULT_SEED),
      store_returns(true) {}

// ============================================================================
// Ticket statistics
// ============================================================================

double full_hit_probability(const Ticket& ticket, const ProbabilityMatrix& matrix) {
    if (ticket.size() != matrix.num_matches()) {
        throw TicketShapeMismatch(ticket.size(), matrix.num_matches());
    }
    double p = 1.0;
    for (size_t m = 0; m < ticket.size(); ++m) {
        double covered = 0.0;
        for (uint8_t o = 0; o < NUM_OUTCOMES; ++o) {
            Outcome outcome = static_cast<Outcome>(o);
            if (ticket[m].contains(outcome)) {
                covered += matrix.probability(m, outcome);
            }
        }
        p *= covered;
    }
    return p;
}

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::vector<TicketStatistics> ticket_statistics(const ProbabilityMatrix& matrix,
                                                const Portfolio& portfolio,
                                                const PayoutMatrix& payouts) {
    const size_t num_matches = matrix.num_matches();
    const size_t num_simulations = payouts.num_simulations();
    const double n = static_cast<double>(num_simulations);

    std::vector<TicketStatistics> stats;
    stats.reserve(portfolio.num_tickets());

    for (size_t t = 0; t < portfolio.num_tickets(); ++t) {
        const Ticket& ticket = portfolio.ticket(t);

        TicketStatistics ts;
        ts.index = t;
        ts.picks = ticket.to_string();
        ts.singles = ticket.singles();
        ts.doubles = ticket.doubles();
        ts.triples = ticket.triples();
        ts.weight = portfolio.weights()[t];
        ts.full_hit_probability = full_hit_probability(ticket, matrix);
        ts.hit_histogram.assign(num_matches + 1, 0);

        double payout_sum = 0.0;
        for (size_t s = 0; s < num_simulations; ++s) {
            ++ts.hit_histogram[payouts.hits(s, t)];
            payout_sum += payouts.payout(s, t);
        }

        if (num_simulations > 0) {
            ts.simulated_full_hit_rate = static_cast<double>(ts.hit_histogram[num_matches]) / n;
            ts.near_miss_rate = num_matches > 0
                ? static_cast<double>(ts.hit_histogram[num_matches - 1]) / n
                : 0.0;
            ts.expected_payout = payout_sum / n;
        }

        stats.push_back(std::move(ts));
    }
    return stats;
}

} // anonymous namespace

// ============================================================================
// Evaluation
// ============================================================================

RiskEvaluation evaluate_portfolio_risk(const ProbabilityMatrix& matrix,
                                       const Portfolio& portfolio,
                                       const EvaluationConfig& config) {
    RiskEvaluation result;
    auto start_time = Clock::now();

    if (portfolio.num_matches() != matrix.num_matches()) {
        throw TicketShapeMismatch(portfolio.num_matches(), matrix.num_matches());
    }

    auto stage_start = Clock::now();
    SimulationBatch batch = simulate_outcomes(matrix, config.num_simulations, config.seed);
    result.simulate_time_ms = elapsed_ms(stage_start);

    result.num_simulations = batch.num_simulations();
    result.num_matches = batch.num_matches();
    result.seed = batch.seed();

    stage_start = Clock::now();
    PayoutMatrix payouts = score_batch(portfolio, batch);
    result.score_time_ms = elapsed_ms(stage_start);

    stage_start = Clock::now();
    std::vector<double> returns = aggregate_returns(payouts, portfolio.weights());
    result.aggregate_time_ms = elapsed_ms(stage_start);

    stage_start = Clock::now();
    result.risk = var_es(returns, config.alpha);
    result.summary = summarize(returns);
    result.tickets = ticket_statistics(matrix, portfolio, payouts);
    result.metrics_time_ms = elapsed_ms(stage_start);

    if (config.store_returns) {
        result.returns = std::move(returns);
    }

    result.execution_time_ms = elapsed_ms(start_time);
    return result;
}

} // namespace poolrisk

#ifndef POOLRISK_EVALUATION_HPP
#define POOLRISK_EVALUATION_HPP

#include "portfolio.hpp"
#include "probability_matrix.hpp"
#include "risk_metrics.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace poolrisk {

// Per-ticket view of the simulated round
struct TicketStatistics {
    size_t index;                       // 0-based position in the portfolio
    std::string picks;                  // e.g. "1|1X|1X2"
    size_t singles;
    size_t doubles;
    size_t triples;
    double weight;                      // normalized stake weight
    double full_hit_probability;        // analytic, assuming independent matches
    double simulated_full_hit_rate;     // share of simulations hitting every match
    double near_miss_rate;              // share of simulations with exactly M-1 hits
    double expected_payout;             // mean payout over the simulations
    std::vector<size_t> hit_histogram;  // simulations per hit count 0..M

    TicketStatistics();
};

// Result of one risk evaluation run
struct RiskEvaluation {
    std::vector<double> returns;        // portfolio return per simulation
    RiskMeasures risk;
    DistributionSummary summary;
    std::vector<TicketStatistics> tickets;

    size_t num_simulations;
    size_t num_matches;
    uint64_t seed;                      // seed actually used

    // Stage timings in milliseconds
    double simulate_time_ms;
    double score_time_ms;
    double aggregate_time_ms;
    double metrics_time_ms;
    double execution_time_ms;

    RiskEvaluation();
};

struct EvaluationConfig {
    size_t num_simulations;
    double alpha;
    std::optional<uint64_t> seed;
    bool store_returns;                 // keep the per-simulation returns

    static constexpr size_t DEFAULT_SIMULATIONS = 50000;
    static constexpr double DEFAULT_ALPHA = 0.95;
    static constexpr uint64_t DEFAULT_SEED = 2025;

    EvaluationConfig();
};

// Probability that every match of the ticket is hit, assuming independence:
// product over matches of the probability mass inside the coverage set.
// Throws TicketShapeMismatch on a length mismatch.
double full_hit_probability(const Ticket& ticket, const ProbabilityMatrix& matrix);

// Simulate the round, score the portfolio, aggregate returns and reduce them
// to VaR/ES plus descriptive statistics.
//
// Throws TicketShapeMismatch when the tickets do not cover exactly the
// matches of the probability matrix (checked before simulating).
RiskEvaluation evaluate_portfolio_risk(const ProbabilityMatrix& matrix,
                                       const Portfolio& portfolio,
                                       const EvaluationConfig& config = EvaluationConfig());

} // namespace poolrisk

#endif // POOLRISK_EVALUATION_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "evaluation.hpp"
#include "errors.hpp"
#include "simulation.hpp"
#include <numeric>

using namespace poolrisk;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

ProbabilityMatrix two_match_round() {
    return ProbabilityMatrix({
        MatchProbabilities("M1", 0.5, 0.3, 0.2),
        MatchProbabilities("M2", 0.4, 0.3, 0.3),
    });
}

// {HOME} on match 1, {HOME, DRAW} on match 2
Ticket home_then_home_or_draw(double weight = 1.0) {
    return Ticket({
        CoverageSet::single(Outcome::Home),
        CoverageSet::single(Outcome::Home).with(Outcome::Draw),
    }, weight);
}

EvaluationConfig config_with(size_t sims, uint64_t seed) {
    EvaluationConfig config;
    config.num_simulations = sims;
    config.seed = seed;
    return config;
}

} // anonymous namespace

// ============================================================================
// Analytic hit probability
// ============================================================================

TEST_CASE("Full-hit probability is the product of covered mass", "[evaluation]") {
    auto matrix = two_match_round();
    REQUIRE_THAT(full_hit_probability(home_then_home_or_draw(), matrix), WithinRel(0.35, 1e-12));

    Ticket triples({CoverageSet::full(), CoverageSet::full()});
    REQUIRE_THAT(full_hit_probability(triples, matrix), WithinRel(1.0, 1e-12));

    Ticket too_long({CoverageSet::full(), CoverageSet::full(), CoverageSet::full()});
    REQUIRE_THROWS_AS(full_hit_probability(too_long, matrix), TicketShapeMismatch);
}

// ============================================================================
// End-to-end
// ============================================================================

TEST_CASE("Two-match round is reproducible end to end", "[evaluation]") {
    auto matrix = two_match_round();
    Portfolio portfolio({home_then_home_or_draw(1.0)});
    auto config = config_with(4, 2025);

    RiskEvaluation first = evaluate_portfolio_risk(matrix, portfolio, config);
    RiskEvaluation second = evaluate_portfolio_risk(matrix, portfolio, config);

    REQUIRE(first.num_simulations == 4);
    REQUIRE(first.num_matches == 2);
    REQUIRE(first.seed == 2025);
    REQUIRE(first.returns.size() == 4);
    REQUIRE(first.returns == second.returns);
    REQUIRE(first.risk.value_at_risk == second.risk.value_at_risk);
    REQUIRE(first.risk.expected_shortfall == second.risk.expected_shortfall);

    // Returns are the default-scheme payouts of the simulated outcomes
    SimulationBatch batch = simulate_outcomes(matrix, 4, 2025);
    for (size_t s = 0; s < 4; ++s) {
        bool full_hit = batch.at(s, 0) == Outcome::Home && batch.at(s, 1) != Outcome::Away;
        REQUIRE(first.returns[s] == (full_hit ? 1.0 : 0.0));
    }
}

TEST_CASE("Evaluation defaults", "[evaluation]") {
    EvaluationConfig config;
    REQUIRE(config.num_simulations == 50000);
    REQUIRE(config.alpha == 0.95);
    REQUIRE(config.seed.has_value());
    REQUIRE(*config.seed == 2025);
    REQUIRE(config.store_returns);
}

TEST_CASE("Ticket statistics track the analytic probabilities", "[evaluation]") {
    auto matrix = two_match_round();
    Portfolio portfolio({home_then_home_or_draw(), Ticket({CoverageSet::full(), CoverageSet::full()})});
    RiskEvaluation result = evaluate_portfolio_risk(matrix, portfolio, config_with(100000, 7));

    REQUIRE(result.tickets.size() == 2);

    const TicketStatistics& t0 = result.tickets[0];
    REQUIRE(t0.picks == "1|1X");
    REQUIRE(t0.singles == 1);
    REQUIRE(t0.doubles == 1);
    REQUIRE(t0.triples == 0);
    REQUIRE_THAT(t0.weight, WithinRel(0.5, 1e-12));
    REQUIRE_THAT(t0.full_hit_probability, WithinRel(0.35, 1e-12));
    REQUIRE_THAT(t0.simulated_full_hit_rate, WithinAbs(0.35, 0.01));
    // Exactly one hit: (H, A) or (not H, H/D)
    REQUIRE_THAT(t0.near_miss_rate, WithinAbs(0.5 * 0.3 + 0.5 * 0.7, 0.01));
    REQUIRE_THAT(t0.expected_payout, WithinAbs(t0.simulated_full_hit_rate, 1e-12));
    REQUIRE(t0.hit_histogram.size() == 3);
    REQUIRE(std::accumulate(t0.hit_histogram.begin(), t0.hit_histogram.end(), size_t{0}) == 100000);

    const TicketStatistics& t1 = result.tickets[1];
    REQUIRE(t1.simulated_full_hit_rate == 1.0);
    REQUIRE(t1.near_miss_rate == 0.0);

    // Portfolio mean is the weighted mean of ticket payouts
    REQUIRE_THAT(result.summary.mean, WithinAbs(0.5 * t0.expected_payout + 0.5 * t1.expected_payout, 1e-9));
}

TEST_CASE("Explicit pay table flows through to returns", "[evaluation]") {
    auto matrix = two_match_round();
    Portfolio portfolio({home_then_home_or_draw()}, PayTable({{2, 10.0}, {1, 1.0}}));
    RiskEvaluation result = evaluate_portfolio_risk(matrix, portfolio, config_with(2000, 3));

    for (double r : result.returns) {
        REQUIRE((r == 0.0 || r == 1.0 || r == 10.0));
    }
    REQUIRE(result.risk.expected_shortfall >= result.risk.value_at_risk);
}

TEST_CASE("Returns can be dropped from the result", "[evaluation]") {
    auto matrix = two_match_round();
    Portfolio portfolio({home_then_home_or_draw()});
    auto config = config_with(100, 1);
    config.store_returns = false;

    RiskEvaluation result = evaluate_portfolio_risk(matrix, portfolio, config);
    REQUIRE(result.returns.empty());
    REQUIRE(result.summary.count == 100);
}

TEST_CASE("Portfolio must cover the round's matches", "[evaluation]") {
    auto matrix = two_match_round();
    Portfolio portfolio({Ticket({CoverageSet::full(), CoverageSet::full(), CoverageSet::full()})});
    REQUIRE_THROWS_AS(evaluate_portfolio_risk(matrix, portfolio, config_with(10, 1)), TicketShapeMismatch);
}

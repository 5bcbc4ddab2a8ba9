#include "json_writer.hpp"
#include "output_file.hpp"

namespace poolrisk {
namespace io {

using json = nlohmann::json;

nlohmann::json summary_to_json(const RiskEvaluation& result, const SummaryMetadata& metadata) {
    json j;

    j["run"] = {
        {"probabilities", metadata.probabilities_source},
        {"portfolio", metadata.portfolio_source},
        {"simulations", result.num_simulations},
        {"matches", result.num_matches},
        {"tickets", result.tickets.size()},
        {"seed", result.seed},
        {"alpha", result.risk.alpha},
        {"pay_table", metadata.pay_table}
    };

    j["risk"] = {
        {result.risk.var_label(), result.risk.value_at_risk},
        {result.risk.es_label(), result.risk.expected_shortfall}
    };

    const DistributionSummary& s = result.summary;
    j["distribution"] = {
        {"count", s.count},
        {"mean", s.mean},
        {"std_dev", s.std_dev},
        {"min", s.min},
        {"max", s.max},
        {"percentiles", {{"p05", s.p05}, {"p50", s.p50}, {"p95", s.p95}}},
        {"prob_positive", s.prob_positive}
    };

    json tickets = json::array();
    for (const auto& t : result.tickets) {
        tickets.push_back({
            {"ticket", t.index + 1},
            {"picks", t.picks},
            {"singles", t.singles},
            {"doubles", t.doubles},
            {"triples", t.triples},
            {"weight", t.weight},
            {"full_hit_probability", t.full_hit_probability},
            {"simulated_full_hit_rate", t.simulated_full_hit_rate},
            {"near_miss_rate", t.near_miss_rate},
            {"expected_payout", t.expected_payout},
            {"hit_histogram", t.hit_histogram}
        });
    }
    j["tickets"] = std::move(tickets);

    j["timings_ms"] = {
        {"simulate", result.simulate_time_ms},
        {"score", result.score_time_ms},
        {"aggregate", result.aggregate_time_ms},
        {"metrics", result.metrics_time_ms},
        {"total", result.execution_time_ms}
    };

    j["warnings"] = metadata.warnings;

    return j;
}

void write_summary_json(std::ostream& os, const RiskEvaluation& result,
                        const SummaryMetadata& metadata, bool pretty_print) {
    os << summary_to_json(result, metadata).dump(pretty_print ? 2 : -1) << '\n';
}

void write_summary_json(const std::string& filepath, const RiskEvaluation& result,
                        const SummaryMetadata& metadata, bool pretty_print) {
    write_file_atomically(filepath, [&](std::ostream& os) {
        write_summary_json(os, result, metadata, pretty_print);
    });
}

} // namespace io
} // namespace poolrisk

#ifndef POOLRISK_PROBABILITY_MATRIX_HPP
#define POOLRISK_PROBABILITY_MATRIX_HPP

#include "outcome.hpp"
#include <array>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace poolrisk {

// Outcome probabilities for one match, indexed by Outcome
struct MatchProbabilities {
    std::string match_id;
    double p_home;
    double p_draw;
    double p_away;

    MatchProbabilities();
    MatchProbabilities(std::string id, double home, double draw, double away);

    double probability(Outcome outcome) const;
    double total() const { return p_home + p_draw + p_away; }
};

// Column names of a probability CSV
struct ProbabilityColumns {
    std::string match_id;   // optional column; empty means "not used"
    std::string home;
    std::string draw;
    std::string away;

    ProbabilityColumns();
    ProbabilityColumns(std::string id, std::string h, std::string d, std::string a);

    // Calibrated columns first, then raw model output
    static std::vector<ProbabilityColumns> default_candidates();
};

// ProbabilityMatrix: immutable M x 3 table of per-match outcome probabilities.
// Every row is validated and renormalized to sum to 1 on construction.
class ProbabilityMatrix {
public:
    static constexpr double SUM_TOLERANCE = 1e-6;

    // Throws InvalidProbabilityRow for a negative / non-finite row or a row
    // whose sum is not positive
    explicit ProbabilityMatrix(std::vector<MatchProbabilities> rows);

    size_t num_matches() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const MatchProbabilities& row(size_t match) const;
    const std::vector<MatchProbabilities>& rows() const { return rows_; }

    double probability(size_t match, Outcome outcome) const;

    // Rows whose input sum was off by more than SUM_TOLERANCE
    size_t rows_renormalized() const { return rows_renormalized_; }

    // Load with an explicit column schema, or the first complete default
    // candidate when no schema is given. Throws SchemaError when no schema
    // matches the header or there are no data rows.
    static ProbabilityMatrix load_from_csv(
        const std::string& filepath,
        const std::optional<ProbabilityColumns>& columns = std::nullopt);
    static ProbabilityMatrix load_from_csv(
        std::istream& is,
        const std::optional<ProbabilityColumns>& columns = std::nullopt);

private:
    std::vector<MatchProbabilities> rows_;
    size_t rows_renormalized_;
};

// Validate and renormalize a single row in place; returns true when the
// original sum drifted by more than the tolerance
bool normalize_row(MatchProbabilities& row, double tolerance = ProbabilityMatrix::SUM_TOLERANCE);

} // namespace poolrisk

#endif // POOLRISK_PROBABILITY_MATRIX_HPP
